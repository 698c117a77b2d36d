#pragma once

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <system_error>
#include <unistd.h>

inline std::error_code lastSystemError()
{
  return std::error_code{errno, std::generic_category()};
}

class UniqueFd
{
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd)
      : fd{fd}
  {
  }

  ~UniqueFd()
  {
    reset();
  }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept
      : fd{other.fd}
  {
    other.fd = -1;
  }

  UniqueFd &operator=(UniqueFd &&other) noexcept
  {
    if (this != &other)
    {
      reset();
      fd = other.fd;
      other.fd = -1;
    }
    return *this;
  }

  // Create-if-absent, owner read/write; truncates unless append is set.
  static UniqueFd openForWrite(const std::string &path, bool append, std::error_code &ec)
  {
    ec.clear();
    UniqueFd result{::open(path.c_str(),
                           O_WRONLY | O_CREAT | O_CLOEXEC | (append ? O_APPEND : O_TRUNC),
                           0644)};
    if (!result)
      ec = lastSystemError();
    return result;
  }

  int get() const
  {
    return fd;
  }

  explicit operator bool() const
  {
    return fd >= 0;
  }

  int release()
  {
    int value{fd};
    fd = -1;
    return value;
  }

  void reset(int newFd = -1)
  {
    if (fd >= 0)
      ::close(fd);
    fd = newFd;
  }

  // Like reset(), but reports the close failure. The descriptor is gone either way.
  std::error_code close()
  {
    if (fd < 0)
      return {};
    const int value{release()};
    if (::close(value) != 0 && errno != EINTR)
      return lastSystemError();
    return {};
  }

private:
  int fd{-1};
};
