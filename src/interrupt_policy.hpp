#pragma once

#include <system_error>

class InterruptPolicy
{
public:
  virtual ~InterruptPolicy() = default;
  virtual std::error_code install() = 0;
};

// Leaves the inherited signal dispositions untouched.
class KeepInterruptsPolicy : public InterruptPolicy
{
public:
  std::error_code install() override
  {
    return {};
  }
};

// Catches SIGINT and SIGTERM with a handler that does nothing, for the
// remaining lifetime of the process.
class IgnoreInterruptsPolicy : public InterruptPolicy
{
public:
  std::error_code install() override;

private:
  static void discard(int signal);
};

// Makes writes to a pipe without readers fail with EPIPE instead of
// killing the process.
std::error_code ignoreBrokenPipes();
