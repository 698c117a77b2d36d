#pragma once

#include <cstddef>
#include <string>
#include <system_error>

#include "fd_utils.hpp"
#include "options.hpp"

// Buffered writer over one descriptor. Owned descriptors are closed on
// destruction; borrowed ones (standard output) are only flushed.
class OutputSink
{
public:
  OutputSink(UniqueFd fd, FileMode mode, std::string name);
  static OutputSink borrow(int fd, std::string name);
  static OutputSink open(const TargetFile &target, std::error_code &ec);

  ~OutputSink();

  OutputSink(const OutputSink &) = delete;
  OutputSink &operator=(const OutputSink &) = delete;
  OutputSink(OutputSink &&other) noexcept;
  OutputSink &operator=(OutputSink &&other) noexcept;

  std::error_code write(const std::string &data);
  std::error_code flush();
  // Flushes, then releases the descriptor. Reports the first failure.
  std::error_code close();

  FileMode mode() const
  {
    return fileMode;
  }

  const std::string &name() const
  {
    return sinkName;
  }

  bool isOpen() const
  {
    return borrowedFd >= 0 || static_cast<bool>(fd);
  }

private:
  UniqueFd fd{};
  int borrowedFd{-1};
  FileMode fileMode{FileMode::Bare};
  std::string sinkName{};
  std::string buffer{};

  int descriptor() const
  {
    return borrowedFd >= 0 ? borrowedFd : fd.get();
  }

  std::error_code writeAll(const char *data, std::size_t size);
};
