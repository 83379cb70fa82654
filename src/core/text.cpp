#include "diffbudget/core/text.h"

namespace diffbudget::core {

namespace {

constexpr char kEscape = '\x1B';

bool in_range(const char ch, const char lo, const char hi) {
  return ch >= lo && ch <= hi;
}

// Length of the escape sequence starting at text[pos] (which is ESC), or 0 if none.
std::size_t escape_length(const std::string_view text, const std::size_t pos) {
  if (pos + 1 >= text.size()) {
    return 0;
  }
  const char next = text[pos + 1];

  if (next == '[') {
    // CSI: parameter bytes 0x30-0x3F, intermediate bytes 0x20-0x2F, final byte 0x40-0x7E.
    std::size_t i = pos + 2;
    while (i < text.size() && in_range(text[i], '0', '?')) {
      ++i;
    }
    while (i < text.size() && in_range(text[i], ' ', '/')) {
      ++i;
    }
    if (i < text.size() && in_range(text[i], '@', '~')) {
      return i - pos + 1;
    }
    return 0;
  }

  // Fe escapes: 0x40-0x5A and 0x5C-0x5F ('[' is the CSI introducer handled above).
  if (in_range(next, '@', 'Z') || in_range(next, '\\', '_')) {
    return 2;
  }
  return 0;
}

}  // namespace

std::string strip_ansi(const std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == kEscape) {
      const std::size_t len = escape_length(text, i);
      if (len > 0) {
        i += len;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

}  // namespace diffbudget::core
