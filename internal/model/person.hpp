#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace heritage::model {

// Exact (trimmed) text of the dataset's person identifier field.
using PersonId = std::string;

struct Person {
  PersonId id;
  std::string name;
  std::optional<std::uint32_t> age;
};

/*
  Canonical identifier order.

  Decimal identifiers compare numerically and sort before any other
  identifier; everything else compares byte-wise. Equal numeric values with
  different text ("007", "7") fall back to the text so the order stays total.
*/
int CompareIds(std::string_view a, std::string_view b);

struct IdLess {
  bool operator()(std::string_view a, std::string_view b) const {
    return CompareIds(a, b) < 0;
  }
};

}  // namespace heritage::model
