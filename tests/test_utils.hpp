#pragma once

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <signal.h>
#include <unistd.h>

#include "fd_utils.hpp"

struct PipeFds
{
  UniqueFd read{};
  UniqueFd write{};

  static std::error_code create(PipeFds &pipeFds)
  {
    int fds[2]{-1, -1};
    if (::pipe(fds) != 0)
      return lastSystemError();
    pipeFds.read.reset(fds[0]);
    pipeFds.write.reset(fds[1]);
    return {};
  }
};

class TempDir
{
public:
  TempDir()
  {
    std::string pattern{(std::filesystem::temp_directory_path() / "chi-test-XXXXXX").string()};
    if (::mkdtemp(pattern.data()))
      root = pattern;
  }

  ~TempDir()
  {
    std::error_code ec{};
    if (!root.empty())
      std::filesystem::remove_all(root, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  std::string path(const std::string &name) const
  {
    return (root / name).string();
  }

private:
  std::filesystem::path root{};
};

inline std::string readFile(const std::string &path)
{
  std::ifstream file{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

inline void writeFile(const std::string &path, const std::string &content)
{
  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  file << content;
}

inline volatile std::sig_atomic_t deliveredSignals{0};

// Installs a counting handler without SA_RESTART, so blocked reads fail
// with EINTR. Restores the previous disposition on destruction.
class ScopedSignalHandler
{
public:
  explicit ScopedSignalHandler(int signum)
      : signum{signum}
  {
    deliveredSignals = 0;
    struct sigaction action{};
    action.sa_handler = &ScopedSignalHandler::count;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    installed = ::sigaction(signum, &action, &previous) == 0;
  }

  ~ScopedSignalHandler()
  {
    if (installed)
      ::sigaction(signum, &previous, nullptr);
  }

  ScopedSignalHandler(const ScopedSignalHandler &) = delete;
  ScopedSignalHandler &operator=(const ScopedSignalHandler &) = delete;

  explicit operator bool() const
  {
    return installed;
  }

  int delivered() const
  {
    return static_cast<int>(deliveredSignals);
  }

private:
  int signum{};
  bool installed{false};
  struct sigaction previous{};

  static void count(int)
  {
    deliveredSignals = deliveredSignals + 1;
  }
};

// Writes everything and closes the write end so readers see end of input.
inline bool feedPipe(PipeFds &pipeFds, const std::string &data)
{
  const char *cursor{data.data()};
  std::size_t left{data.size()};
  while (left > 0)
  {
    const ssize_t written{::write(pipeFds.write.get(), cursor, left)};
    if (written <= 0)
      return false;
    cursor += written;
    left -= static_cast<std::size_t>(written);
  }
  pipeFds.write.reset();
  return true;
}

inline std::string drainPipe(PipeFds &pipeFds)
{
  pipeFds.write.reset();
  std::string result{};
  char chunk[4096];
  while (true)
  {
    const ssize_t count{::read(pipeFds.read.get(), chunk, sizeof(chunk))};
    if (count <= 0)
      break;
    result.append(chunk, static_cast<std::size_t>(count));
  }
  return result;
}
