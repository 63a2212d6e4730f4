#pragma once

#include <memory>

#include "internal/graph/ancestry_graph.hpp"
#include "internal/model/ancestry_path.hpp"

namespace heritage::query {

/*
  Answers ancestor -> descendant queries over one loaded graph.

  Throws UnknownIdentifier (ancestor checked first) or NoPathFound. The
  graph is never modified, so one finder can serve any number of queries.
*/
class PathFinder {
 public:
  explicit PathFinder(std::shared_ptr<const graph::AncestryGraph> graph);

  model::AncestryPath Find(const model::PathQuery& query) const;

 private:
  model::PathStep MakeStep(model::NodeIndex node) const;

  std::shared_ptr<const graph::AncestryGraph> graph_;
};

} // namespace heritage::query
