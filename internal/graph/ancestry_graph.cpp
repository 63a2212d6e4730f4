#include "internal/graph/ancestry_graph.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>

namespace heritage::graph {

using heritage::model::EdgeIndex;
using heritage::model::NodeIndex;

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

NodeIndex AncestryGraph::AddNodeIfAbsent(const model::PersonId& id) {
  if (auto it = index_.find(id); it != index_.end())
    return it->second;

  const NodeIndex index = persons_.size();

  model::Person person;
  person.id = id;
  persons_.push_back(std::move(person));
  out_.emplace_back();
  index_.emplace(id, index);

  return index;
}

EdgeIndex AncestryGraph::AddEdge(NodeIndex source, NodeIndex target, std::string kind, std::size_t line) {
  if (source >= persons_.size() || target >= persons_.size())
    throw std::out_of_range("edge endpoint is not a node of this graph");
  if (source == target)
    throw std::invalid_argument("self-loop on person " + persons_[source].id);

  const EdgeIndex index = edges_.size();
  edges_.push_back({source, target, std::move(kind), line});

  // keep canonical order; equal targets stay in insertion order
  auto& out = out_[source];
  const auto& target_id = persons_[target].id;
  auto pos = std::upper_bound(out.begin(), out.end(), target_id, [this](const model::PersonId& id, EdgeIndex e) {
    return model::CompareIds(id, persons_[edges_[e].target].id) < 0;
  });
  out.insert(pos, index);

  return index;
}

std::optional<NodeIndex> AncestryGraph::Find(std::string_view id) const {
  auto it = index_.find(std::string(id));
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

std::optional<std::vector<EdgeIndex>> AncestryGraph::ShortestPath(NodeIndex from, NodeIndex to) const {
  if (from >= persons_.size() || to >= persons_.size())
    throw std::out_of_range("path endpoint is not a node of this graph");

  if (from == to)
    return std::vector<EdgeIndex>{};

  std::vector<std::optional<EdgeIndex>> via(persons_.size());
  std::vector<bool> visited(persons_.size(), false);
  std::queue<NodeIndex> q;

  visited[from] = true;
  q.push(from);

  while (!q.empty() && !visited[to]) {
    const auto node = q.front();
    q.pop();

    for (const auto e : out_[node]) {
      const auto next = edges_[e].target;
      if (visited[next])
        continue;

      visited[next] = true;
      via[next] = e;
      q.push(next);
    }
  }

  if (!visited[to])
    return std::nullopt;

  std::vector<EdgeIndex> path;
  for (NodeIndex node = to; node != from; node = edges_[*via[node]].source) {
    path.push_back(*via[node]);
  }
  std::reverse(path.begin(), path.end());

  return path;
}

} // namespace heritage::graph
