#pragma once

#include <string>
#include <vector>

#include "options.hpp"

class ArgumentParser
{
public:
  // Parses argv without the program name. On failure returns false and sets error.
  bool parse(const std::vector<std::string> &tokens, ParsedArguments &parsed, std::string &error) const;

private:
  enum class Step
  {
    Continue,
    Stop,
    Fail
  };

  struct ParseState
  {
    ParsedArguments &parsed;
    PendingFileOptions pending{};
    std::string error{};
  };

  void consumeFile(ParseState &state, const std::string &path) const;
  Step handleLongOption(ParseState &state, const std::string &token) const;
  Step handleShortCluster(ParseState &state, const std::string &cluster) const;
};
