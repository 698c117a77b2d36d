#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "escape_stripper.hpp"
#include "line_reader.hpp"
#include "output_sink.hpp"

struct StreamError
{
  std::string context{};
  std::error_code code{};
};

class FanoutCopier
{
public:
  FanoutCopier(LineReader &input, OutputSink &primary, std::vector<OutputSink> &sinks);

  // Copies until end of input. Returns the first read or write failure.
  std::optional<StreamError> run();

private:
  LineReader &input;
  OutputSink &primary;
  std::vector<OutputSink> &sinks;
  EscapeStripper stripper{};

  std::optional<StreamError> writeLine(const std::string &line);
  std::optional<StreamError> flushAll();
};
