#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/person.hpp"
#include "internal/model/relationship.hpp"

namespace heritage::graph {

/*
  AncestryGraph

  Directed multigraph stored as an arena: persons and edges live in vectors
  and refer to each other by index. Every node's outgoing edges are kept in
  canonical order (target id ascending, then insertion order), which is what
  makes ShortestPath deterministic.

  Mutation happens only while GraphBuilder folds records; consumers receive a
  const graph.
*/
class AncestryGraph {
 public:
  // Index of the person with this id, creating an empty one if needed.
  model::NodeIndex AddNodeIfAbsent(const model::PersonId& id);

  model::EdgeIndex AddEdge(model::NodeIndex source, model::NodeIndex target, std::string kind, std::size_t line);

  std::optional<model::NodeIndex> Find(std::string_view id) const;

  /*
    Unweighted breadth-first search along edge direction.

    Returns the edge indices of the shortest path from -> to, an empty vector
    when from == to and nullopt when to is unreachable. Among equally short
    paths the one whose id sequence is smallest in canonical order wins; between
    two adjacent persons the first inserted edge is used.
  */
  std::optional<std::vector<model::EdgeIndex>> ShortestPath(model::NodeIndex from, model::NodeIndex to) const;

  const model::Person& person(model::NodeIndex index) const {
    return persons_.at(index);
  }

  model::Person& mutable_person(model::NodeIndex index) {
    return persons_.at(index);
  }

  const model::RelationshipEdge& edge(model::EdgeIndex index) const {
    return edges_.at(index);
  }

  const std::vector<model::EdgeIndex>& OutEdges(model::NodeIndex index) const {
    return out_.at(index);
  }

  std::size_t NodeCount() const {
    return persons_.size();
  }

  std::size_t EdgeCount() const {
    return edges_.size();
  }

 private:
  std::vector<model::Person> persons_;
  std::unordered_map<model::PersonId, model::NodeIndex> index_;

  std::vector<model::RelationshipEdge> edges_;
  std::vector<std::vector<model::EdgeIndex>> out_;
};

} // namespace heritage::graph
