#include "internal/query/path_finder.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heritage::query {

using heritage::model::AncestryPath;
using heritage::model::NodeIndex;
using heritage::model::PathQuery;
using heritage::model::PathStep;
using heritage::observability::IntField;
using heritage::observability::StringField;

PathFinder::PathFinder(std::shared_ptr<const graph::AncestryGraph> graph) : graph_(std::move(graph)) {
  if (!graph_)
    throw std::invalid_argument("PathFinder requires a graph");
}

PathStep PathFinder::MakeStep(NodeIndex node) const {
  const auto& person = graph_->person(node);

  PathStep step;
  step.id   = person.id;
  step.name = person.name;
  step.age  = person.age;
  return step;
}

AncestryPath PathFinder::Find(const PathQuery& query) const {
  const auto from = graph_->Find(query.ancestor_id);
  if (!from)
    throw heritage::util::UnknownIdentifier(query.ancestor_id, "ancestor");

  const auto to = graph_->Find(query.descendant_id);
  if (!to)
    throw heritage::util::UnknownIdentifier(query.descendant_id, "descendant");

  const auto edges = graph_->ShortestPath(*from, *to);
  if (!edges)
    throw heritage::util::NoPathFound(query.ancestor_id, query.descendant_id);

  AncestryPath path;
  path.steps.reserve(edges->size() + 1);

  for (const auto e : *edges) {
    const auto& edge = graph_->edge(e);
    auto step = MakeStep(edge.source);
    step.kind = edge.kind;
    path.steps.push_back(std::move(step));
  }
  path.steps.push_back(MakeStep(*to));

  HERITAGE_LOG_DEBUG("Path found",
                     {StringField("ancestor", query.ancestor_id),
                      StringField("descendant", query.descendant_id),
                      IntField("hops", static_cast<std::int64_t>(path.HopCount()))});
  return path;
}

} // namespace heritage::query
