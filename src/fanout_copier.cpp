#include "fanout_copier.hpp"

FanoutCopier::FanoutCopier(LineReader &input, OutputSink &primary, std::vector<OutputSink> &sinks)
    : input{input},
      primary{primary},
      sinks{sinks}
{
}

std::optional<StreamError> FanoutCopier::run()
{
  std::string line{};
  while (true)
  {
    // About to block on the input; let readers downstream see what we have.
    if (!input.hasBufferedLine())
    {
      if (auto error{flushAll()}; error)
        return error;
    }

    std::error_code ec{};
    const auto status{input.next(line, ec)};
    if (status == LineReader::Status::End)
      return std::nullopt;
    if (status == LineReader::Status::Error)
      return StreamError{"read error", ec};

    if (line.empty())
      continue;

    if (auto error{writeLine(line)}; error)
      return error;
  }
}

std::optional<StreamError> FanoutCopier::writeLine(const std::string &line)
{
  if (auto ec{primary.write(line)}; ec)
    return StreamError{primary.name() + " write error", ec};

  for (auto &sink : sinks)
  {
    const auto ec{sink.mode() == FileMode::Care ? sink.write(stripper.strip(line))
                                                : sink.write(line)};
    if (ec)
      return StreamError{"write error on '" + sink.name() + "'", ec};
  }
  return std::nullopt;
}

std::optional<StreamError> FanoutCopier::flushAll()
{
  if (auto ec{primary.flush()}; ec)
    return StreamError{primary.name() + " write error", ec};

  for (auto &sink : sinks)
  {
    if (auto ec{sink.flush()}; ec)
      return StreamError{"write error on '" + sink.name() + "'", ec};
  }
  return std::nullopt;
}
