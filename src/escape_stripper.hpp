#pragma once

#include <cstddef>
#include <string>

// Removes ANSI CSI sequences: ESC '[' [0-9;]* [0x20-0x2F]* [0x40-0x7E].
// Unterminated sequences are left in place.
class EscapeStripper
{
public:
  std::string strip(const std::string &input) const;

  // Length of the sequence starting at text[start], or 0 when none starts there.
  static std::size_t matchLength(const std::string &text, std::size_t start);

private:
  static constexpr char escape{'\x1b'};
  static constexpr char introducer{'['};

  static bool isParameter(char c)
  {
    return (c >= '0' && c <= '9') || c == ';';
  }

  static bool isIntermediate(char c)
  {
    return c >= 0x20 && c <= 0x2F;
  }

  static bool isFinal(char c)
  {
    return c >= 0x40 && c <= 0x7E;
  }
};
