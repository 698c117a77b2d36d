#pragma once

#include <string>
#include <vector>

#include "argument_parser.hpp"
#include "interrupt_policy.hpp"
#include "options.hpp"
#include "output_sink.hpp"

class Chi
{
public:
  static constexpr int exitSuccess{0};
  static constexpr int exitFailure{1};
  static constexpr int exitUsage{2};

  Chi(int argc, char *argvInput[], InterruptPolicy &interruptPolicy);
  Chi(std::vector<std::string> args, int inputFd, int outputFd, InterruptPolicy &interruptPolicy);

  int run();

  std::vector<std::string> args;

private:
  int inputFd{0};
  int outputFd{1};
  InterruptPolicy &interruptPolicy;
  ArgumentParser parser{};

  int printHelp();
  int printVersion();
  int printText(const std::string &text);
  bool openSinks(const std::vector<TargetFile> &targets, std::vector<OutputSink> &sinks) const;
  int copy(std::vector<OutputSink> &sinks);
  bool releaseSinks(std::vector<OutputSink> &sinks) const;
};
