#include "utf8.hpp"

#include <cstdint>

namespace heritage::util {

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  const auto  n = text.size();

  while (i < n) {
    const auto b0 = static_cast<uint8_t>(text[i]);

    if (b0 < 0x80) {
      ++i;
      continue;
    }

    std::size_t len   = 0;
    uint8_t     lower = 0x80;
    uint8_t     upper = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
      len = 2;
    } else if (b0 == 0xE0) {
      len   = 3;
      lower = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
      len = 3;
    } else if (b0 == 0xED) {
      len   = 3;
      upper = 0x9F; // surrogates
    } else if (b0 == 0xF0) {
      len   = 4;
      lower = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
      len = 4;
    } else if (b0 == 0xF4) {
      len   = 4;
      upper = 0x8F;
    } else {
      return false;
    }

    if (i + len > n)
      return false;

    const auto b1 = static_cast<uint8_t>(text[i + 1]);
    if (b1 < lower || b1 > upper)
      return false;

    for (std::size_t k = 2; k < len; ++k) {
      const auto bk = static_cast<uint8_t>(text[i + k]);
      if (bk < 0x80 || bk > 0xBF)
        return false;
    }

    i += len;
  }

  return true;
}

std::size_t ByteOrderMarkLength(std::string_view text) {
  if (text.size() >= 3 && static_cast<uint8_t>(text[0]) == 0xEF && static_cast<uint8_t>(text[1]) == 0xBB &&
      static_cast<uint8_t>(text[2]) == 0xBF) {
    return 3;
  }
  return 0;
}

} // namespace heritage::util
