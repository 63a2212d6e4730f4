#pragma once

#include <cstddef>
#include <string_view>

namespace heritage::util {

/*
  UTF-8 helpers

  Strict RFC 3629 validation: no overlong forms, no surrogates, nothing
  above U+10FFFF.
*/

bool IsValidUtf8(std::string_view text);

// Length of a leading byte order mark, 0 when absent.
std::size_t ByteOrderMarkLength(std::string_view text);

} // namespace heritage::util
