#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/person.hpp"

namespace heritage::model {

struct PathQuery {
  PersonId ancestor_id;
  PersonId descendant_id;
};

struct PathStep {
  PersonId id;
  std::string name;
  std::optional<std::uint32_t> age;

  // Relationship to the next step, unset on the last one.
  std::optional<std::string> kind;
};

/*
  Result of one successful query, ancestor first. Holds copies, so it does
  not keep the graph alive.
*/
struct AncestryPath {
  std::vector<PathStep> steps;

  std::size_t HopCount() const {
    return steps.empty() ? 0 : steps.size() - 1;
  }
};

}  // namespace heritage::model
