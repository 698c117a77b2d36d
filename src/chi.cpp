#include "chi.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <unistd.h>
#include <utility>

#include "fanout_copier.hpp"
#include "line_reader.hpp"

namespace
{
  const char *const primaryName{"stdout"};

  void reportError(const std::string &message)
  {
    std::cerr << programName << ": " << message << "\n";
  }

  void reportError(const std::string &context, const std::error_code &ec)
  {
    reportError(context + ": " + ec.message());
  }

  std::string usageText()
  {
    const std::string name{programName};
    return "Usage: " + name + " [OPTIONS] [[FILE_OPTS]... FILE]...\n"
                              "\n"
                              "OPTIONS:\n"
                              "  -i, --ignore-interrupts   ignore interrupt signals\n"
                              "      --help                display this help and exit\n"
                              "      --version             output version information and exit\n"
                              "\n"
                              "FILE_OPTS (apply to the next FILE only):\n"
                              "  -a, --append              append to FILE (do not overwrite)\n"
                              "  -b, --bare                write input as-is (keep ANSI escapes)\n"
                              "  -c, --care                strip ANSI escapes (plain text)\n"
                              "\n"
                              "Copy standard input to each FILE, and also to standard output.\n"
                              "Standard output always receives the input unmodified.\n";
  }
}

Chi::Chi(int argc, char *argvInput[], InterruptPolicy &interruptPolicy)
    : inputFd{STDIN_FILENO},
      outputFd{STDOUT_FILENO},
      interruptPolicy{interruptPolicy}
{
  if (argc > 1)
  {
    args.reserve(static_cast<std::size_t>(argc - 1));
    std::transform(argvInput + 1, argvInput + argc, std::back_inserter(args),
                   [](char *arg)
                   { return std::string{arg ? arg : ""}; });
  }
}

Chi::Chi(std::vector<std::string> args, int inputFd, int outputFd, InterruptPolicy &interruptPolicy)
    : args{std::move(args)},
      inputFd{inputFd},
      outputFd{outputFd},
      interruptPolicy{interruptPolicy}
{
}

int Chi::run()
{
  ParsedArguments parsed{};
  std::string error{};
  if (!parser.parse(args, parsed, error))
  {
    reportError(error);
    std::cerr << "Try '" << programName << " --help' for more information.\n";
    return exitUsage;
  }

  if (parsed.action == CliAction::Help)
    return printHelp();
  if (parsed.action == CliAction::Version)
    return printVersion();

  if (parsed.global.ignoreInterrupts)
  {
    if (auto ec{interruptPolicy.install()}; ec)
    {
      reportError("cannot ignore interrupts", ec);
      return exitFailure;
    }
  }

  if (auto ec{ignoreBrokenPipes()}; ec)
  {
    reportError("cannot ignore SIGPIPE", ec);
    return exitFailure;
  }

  std::vector<OutputSink> sinks{};
  if (!openSinks(parsed.targets, sinks))
    return exitFailure;

  return copy(sinks);
}

int Chi::printHelp()
{
  return printText(usageText());
}

int Chi::printVersion()
{
  return printText(std::string{programName} + " " + programVersion + "\n");
}

int Chi::printText(const std::string &text)
{
  OutputSink primary{OutputSink::borrow(outputFd, primaryName)};
  auto ec{primary.write(text)};
  if (auto closeEc{primary.close()}; closeEc && !ec)
    ec = closeEc;
  if (ec)
  {
    reportError(std::string{primaryName} + " write error", ec);
    return exitFailure;
  }
  return exitSuccess;
}

bool Chi::openSinks(const std::vector<TargetFile> &targets, std::vector<OutputSink> &sinks) const
{
  sinks.reserve(targets.size());
  for (const auto &target : targets)
  {
    std::error_code ec{};
    OutputSink sink{OutputSink::open(target, ec)};
    if (ec)
    {
      reportError("cannot open '" + target.path + "'", ec);
      releaseSinks(sinks);
      return false;
    }
    sinks.push_back(std::move(sink));
  }
  return true;
}

int Chi::copy(std::vector<OutputSink> &sinks)
{
  OutputSink primary{OutputSink::borrow(outputFd, primaryName)};
  LineReader input{inputFd};

  FanoutCopier copier{input, primary, sinks};
  const auto error{copier.run()};
  if (error)
    reportError(error->context, error->code);

  bool released{true};
  if (auto ec{primary.close()}; ec)
  {
    reportError(primary.name() + " flush error", ec);
    released = false;
  }
  if (!releaseSinks(sinks))
    released = false;

  return (error || !released) ? exitFailure : exitSuccess;
}

bool Chi::releaseSinks(std::vector<OutputSink> &sinks) const
{
  bool ok{true};
  for (auto &sink : sinks)
  {
    if (!sink.isOpen())
      continue;
    if (auto ec{sink.close()}; ec)
    {
      reportError("close error on '" + sink.name() + "'", ec);
      ok = false;
    }
  }
  return ok;
}
