#include "chi.hpp"

#include <iostream>

int main(int argc, char *argv[])
{
  // Diagnostics go out as soon as they are written.
  std::cerr << std::unitbuf;

  IgnoreInterruptsPolicy interruptPolicy{};
  Chi chi{argc, argv, interruptPolicy};
  return chi.run();
}
