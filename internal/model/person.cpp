#include "internal/model/person.hpp"

#include <algorithm>

namespace heritage::model {

namespace {

bool IsDecimal(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view StripLeadingZeros(std::string_view s) {
  const auto first = s.find_first_not_of('0');
  return first == std::string_view::npos ? s.substr(s.size() - 1) : s.substr(first);
}

}  // namespace

int CompareIds(std::string_view a, std::string_view b) {
  const bool a_num = IsDecimal(a);
  const bool b_num = IsDecimal(b);

  if (a_num != b_num)
    return a_num ? -1 : 1;

  if (a_num) {
    const auto da = StripLeadingZeros(a);
    const auto db = StripLeadingZeros(b);
    if (da.size() != db.size())
      return da.size() < db.size() ? -1 : 1;
    if (const int c = da.compare(db); c != 0)
      return c < 0 ? -1 : 1;
  }

  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

}  // namespace heritage::model
