#include "escape_stripper.hpp"

std::string EscapeStripper::strip(const std::string &input) const
{
  std::size_t next{input.find(escape)};
  if (next == std::string::npos)
    return input;

  std::string output{};
  output.reserve(input.size());
  output.append(input, 0, next);

  while (next < input.size())
  {
    const std::size_t length{matchLength(input, next)};
    if (length > 0)
    {
      next += length;
      continue;
    }

    // Not a sequence: keep the byte and rescan from the following one.
    const std::size_t found{input.find(escape, next + 1)};
    const std::size_t stop{found == std::string::npos ? input.size() : found};
    output.append(input, next, stop - next);
    next = stop;
  }

  return output;
}

std::size_t EscapeStripper::matchLength(const std::string &text, std::size_t start)
{
  if (start + 1 >= text.size() || text[start] != escape || text[start + 1] != introducer)
    return 0;

  std::size_t index{start + 2};
  while (index < text.size() && isParameter(text[index]))
    ++index;
  while (index < text.size() && isIntermediate(text[index]))
    ++index;

  if (index >= text.size() || !isFinal(text[index]))
    return 0;
  return index + 1 - start;
}
