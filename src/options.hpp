#pragma once

#include <cstddef>
#include <string>
#include <vector>

#ifndef CHI_VERSION
#define CHI_VERSION "0.1.0"
#endif

inline constexpr const char *programName{"chi"};
inline constexpr const char *programVersion{CHI_VERSION};

inline constexpr std::size_t inputBufferSize{64 * 1024};
inline constexpr std::size_t outputBufferSize{64 * 1024};

enum class FileMode
{
  Bare, // keep escape sequences
  Care  // strip escape sequences
};

struct GlobalOptions
{
  bool ignoreInterrupts{false};
};

// Options seen since the last FILE; they apply to the next FILE only.
struct PendingFileOptions
{
  bool append{false};
  FileMode mode{FileMode::Bare};
};

struct TargetFile
{
  std::string path{};
  bool append{false};
  FileMode mode{FileMode::Bare};
};

enum class CliAction
{
  Run,
  Help,
  Version
};

struct ParsedArguments
{
  CliAction action{CliAction::Run};
  GlobalOptions global{};
  std::vector<TargetFile> targets{};
};

// Snapshots the pending options for path and resets them to the defaults.
inline TargetFile consumePendingOptions(PendingFileOptions &pending, const std::string &path)
{
  TargetFile target{path, pending.append, pending.mode};
  pending = PendingFileOptions{};
  return target;
}
