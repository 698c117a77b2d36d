#pragma once

#include <cstddef>
#include <string>
#include <system_error>

class LineReader
{
public:
  enum class Status
  {
    Line,
    End,
    Error
  };

  explicit LineReader(int fd);

  // Reads up to and including the next '\n'. The last line of input may
  // lack one. An interrupted read yields Status::Line with an empty line.
  Status next(std::string &line, std::error_code &ec);

  // True when next() can return a complete line without touching the descriptor.
  bool hasBufferedLine();

private:
  int fd{-1};
  std::string buffer{};
  std::size_t offset{0};
  // buffer[offset, scanned) is known to hold no '\n'.
  std::size_t scanned{0};
  bool eof{false};

  std::size_t findNewline();
  void compact();
};
