#include "line_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <unistd.h>

#include "options.hpp"

LineReader::LineReader(int fd)
    : fd{fd}
{
  buffer.reserve(inputBufferSize);
}

bool LineReader::hasBufferedLine()
{
  return findNewline() != std::string::npos;
}

std::size_t LineReader::findNewline()
{
  const std::size_t newline{buffer.find('\n', std::max(offset, scanned))};
  scanned = newline == std::string::npos ? buffer.size() : newline;
  return newline;
}

LineReader::Status LineReader::next(std::string &line, std::error_code &ec)
{
  line.clear();
  ec.clear();

  while (true)
  {
    const std::size_t newline{findNewline()};
    if (newline != std::string::npos)
    {
      line.assign(buffer, offset, newline + 1 - offset);
      offset = newline + 1;
      return Status::Line;
    }

    if (eof)
    {
      if (offset < buffer.size())
      {
        line.assign(buffer, offset, std::string::npos);
        offset = buffer.size();
        return Status::Line;
      }
      return Status::End;
    }

    compact();
    const std::size_t used{buffer.size()};
    buffer.resize(used + inputBufferSize);
    const ssize_t count{::read(fd, &buffer[used], inputBufferSize)};
    const int readErrno{errno};
    buffer.resize(used + (count > 0 ? static_cast<std::size_t>(count) : 0));

    if (count < 0)
    {
      if (readErrno == EINTR)
        return Status::Line;
      ec = std::error_code{readErrno, std::generic_category()};
      return Status::Error;
    }
    if (count == 0)
      eof = true;
  }
}

void LineReader::compact()
{
  if (offset == 0)
    return;
  buffer.erase(0, offset);
  scanned = scanned > offset ? scanned - offset : 0;
  offset = 0;
}
