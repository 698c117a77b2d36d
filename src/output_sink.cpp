#include "output_sink.hpp"

#include <utility>

OutputSink::OutputSink(UniqueFd fd, FileMode mode, std::string name)
    : fd{std::move(fd)},
      fileMode{mode},
      sinkName{std::move(name)}
{
  buffer.reserve(outputBufferSize);
}

OutputSink::OutputSink(OutputSink &&other) noexcept
    : fd{std::move(other.fd)},
      borrowedFd{other.borrowedFd},
      fileMode{other.fileMode},
      sinkName{std::move(other.sinkName)},
      buffer{std::move(other.buffer)}
{
  other.borrowedFd = -1;
  other.buffer.clear();
}

OutputSink &OutputSink::operator=(OutputSink &&other) noexcept
{
  if (this != &other)
  {
    if (isOpen())
      static_cast<void>(close());
    fd = std::move(other.fd);
    borrowedFd = other.borrowedFd;
    fileMode = other.fileMode;
    sinkName = std::move(other.sinkName);
    buffer = std::move(other.buffer);
    other.borrowedFd = -1;
    other.buffer.clear();
  }
  return *this;
}

OutputSink OutputSink::borrow(int fd, std::string name)
{
  OutputSink sink{UniqueFd{}, FileMode::Bare, std::move(name)};
  sink.borrowedFd = fd;
  return sink;
}

OutputSink OutputSink::open(const TargetFile &target, std::error_code &ec)
{
  UniqueFd fd{UniqueFd::openForWrite(target.path, target.append, ec)};
  return OutputSink{std::move(fd), target.mode, target.path};
}

OutputSink::~OutputSink()
{
  if (isOpen())
    static_cast<void>(close());
}

std::error_code OutputSink::write(const std::string &data)
{
  if (buffer.size() + data.size() > outputBufferSize)
  {
    if (auto ec{flush()}; ec)
      return ec;
  }

  if (data.size() >= outputBufferSize)
    return writeAll(data.data(), data.size());

  buffer += data;
  return {};
}

std::error_code OutputSink::flush()
{
  if (buffer.empty())
    return {};

  auto ec{writeAll(buffer.data(), buffer.size())};
  buffer.clear();
  return ec;
}

std::error_code OutputSink::close()
{
  auto ec{flush()};
  borrowedFd = -1;
  if (auto closeEc{fd.close()}; closeEc && !ec)
    ec = closeEc;
  return ec;
}

std::error_code OutputSink::writeAll(const char *data, std::size_t size)
{
  if (!isOpen())
    return std::make_error_code(std::errc::bad_file_descriptor);

  while (size > 0)
  {
    const ssize_t written{::write(descriptor(), data, size)};
    if (written < 0)
    {
      if (errno == EINTR)
        continue;
      return lastSystemError();
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
  return {};
}
