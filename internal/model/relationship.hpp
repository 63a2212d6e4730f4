#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/person.hpp"

namespace heritage::model {

/*
  One validated dataset row.
*/
struct RelationshipRecord {
  std::size_t line = 0;

  PersonId source_id;
  std::string source_name;
  std::optional<std::uint32_t> source_age;

  std::string kind;

  PersonId target_id;
  std::string target_name;
  std::optional<std::uint32_t> target_age;
};

using NodeIndex = std::size_t;
using EdgeIndex = std::size_t;

/*
  Directed ancestor -> descendant link.
*/
struct RelationshipEdge {
  NodeIndex source = 0;
  NodeIndex target = 0;
  std::string kind;
  std::size_t line = 0;
};

}  // namespace heritage::model
