#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/ancestry_graph.hpp"
#include "internal/model/relationship.hpp"

namespace heritage::graph {

/*
  Folds relationship records, in file order, into an AncestryGraph.

  First occurrence of a person populates its attributes; later records may
  fill attributes that are still unknown but never change known ones
  (ConflictingPersonData). Every record becomes one edge, duplicates
  included.
*/
class GraphBuilder {
 public:
  GraphBuilder();

  void Add(const model::RelationshipRecord& record);

  // Hands the graph out; the builder starts over empty afterwards.
  std::shared_ptr<const AncestryGraph> Build();

  static std::shared_ptr<const AncestryGraph> BuildFrom(const std::vector<model::RelationshipRecord>& records);

 private:
  model::NodeIndex Resolve(const model::PersonId& id,
                           const std::string& name,
                           const std::optional<std::uint32_t>& age,
                           std::size_t line);

  std::unique_ptr<AncestryGraph> graph_;
};

} // namespace heritage::graph
