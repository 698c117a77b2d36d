#include "argument_parser.hpp"

bool ArgumentParser::parse(const std::vector<std::string> &tokens, ParsedArguments &parsed, std::string &error) const
{
  parsed = ParsedArguments{};
  error.clear();
  ParseState state{parsed};

  for (std::size_t i{}; i < tokens.size(); ++i)
  {
    const std::string &token{tokens[i]};

    if (token == "--")
    {
      for (std::size_t j{i + 1}; j < tokens.size(); ++j)
        consumeFile(state, tokens[j]);
      return true;
    }

    Step step{Step::Continue};
    if (token.compare(0, 2, "--") == 0)
      step = handleLongOption(state, token);
    else if (token.size() > 1 && token[0] == '-')
      step = handleShortCluster(state, token.substr(1));
    else
      consumeFile(state, token);

    if (step == Step::Stop)
      return true;
    if (step == Step::Fail)
    {
      error = state.error;
      return false;
    }
  }

  return true;
}

void ArgumentParser::consumeFile(ParseState &state, const std::string &path) const
{
  state.parsed.targets.push_back(consumePendingOptions(state.pending, path));
}

ArgumentParser::Step ArgumentParser::handleLongOption(ParseState &state, const std::string &token) const
{
  if (token == "--help")
  {
    state.parsed.action = CliAction::Help;
    return Step::Stop;
  }
  if (token == "--version")
  {
    state.parsed.action = CliAction::Version;
    return Step::Stop;
  }

  if (token == "--ignore-interrupts")
    state.parsed.global.ignoreInterrupts = true;
  else if (token == "--append")
    state.pending.append = true;
  else if (token == "--bare")
    state.pending.mode = FileMode::Bare;
  else if (token == "--care")
    state.pending.mode = FileMode::Care;
  else
  {
    state.error = "unknown option: " + token;
    return Step::Fail;
  }
  return Step::Continue;
}

ArgumentParser::Step ArgumentParser::handleShortCluster(ParseState &state, const std::string &cluster) const
{
  for (char c : cluster)
  {
    switch (c)
    {
    case 'i':
      state.parsed.global.ignoreInterrupts = true;
      break;
    case 'a':
      state.pending.append = true;
      break;
    case 'b':
      state.pending.mode = FileMode::Bare;
      break;
    case 'c':
      state.pending.mode = FileMode::Care;
      break;
    default:
      state.error = std::string{"unknown option: -"} + c;
      return Step::Fail;
    }
  }
  return Step::Continue;
}
