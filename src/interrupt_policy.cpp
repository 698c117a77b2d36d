#include "interrupt_policy.hpp"

#include <initializer_list>
#include <signal.h>

#include "fd_utils.hpp"

std::error_code IgnoreInterruptsPolicy::install()
{
  struct sigaction action{};
  action.sa_handler = &IgnoreInterruptsPolicy::discard;
  action.sa_flags = SA_RESTART;
  sigemptyset(&action.sa_mask);

  for (int signum : {SIGINT, SIGTERM})
  {
    if (::sigaction(signum, &action, nullptr) != 0)
      return lastSystemError();
  }
  return {};
}

void IgnoreInterruptsPolicy::discard(int)
{
}

std::error_code ignoreBrokenPipes()
{
  struct sigaction action{};
  action.sa_handler = SIG_IGN;
  sigemptyset(&action.sa_mask);

  if (::sigaction(SIGPIPE, &action, nullptr) != 0)
    return lastSystemError();
  return {};
}
