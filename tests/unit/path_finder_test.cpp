#include "internal/query/path_finder.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <optional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/graph/graph_builder.hpp"
#include "internal/util/errors.hpp"

namespace {

using heritage::graph::AncestryGraph;
using heritage::graph::GraphBuilder;
using heritage::model::AncestryPath;
using heritage::model::PathQuery;
using heritage::model::RelationshipRecord;
using heritage::query::PathFinder;
using heritage::util::NoPathFound;
using heritage::util::UnknownIdentifier;

RelationshipRecord MakeRecord(const std::string& source,
                              const std::string& name,
                              const std::string& kind,
                              const std::string& target,
                              const std::string& target_name = "") {
  static std::size_t line = 1;

  RelationshipRecord record;
  record.line        = ++line;
  record.source_id   = source;
  record.source_name = name;
  record.kind        = kind;
  record.target_id   = target;
  record.target_name = target_name;
  return record;
}

template <typename Error, typename Fn>
Error ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e;
  }
  assert(false && "expected exception was not thrown");
  throw std::logic_error("unreachable");
}

std::shared_ptr<const AncestryGraph> ExampleGraph() {
  return GraphBuilder::BuildFrom({
      MakeRecord("20", "Name A", "Father", "6"),
      MakeRecord("6", "Name B", "Father", "1", "Name C"),
      MakeRecord("30", "Name D", "Mother", "31", "Name E"),
  });
}

std::vector<std::string> Ids(const AncestryPath& path) {
  std::vector<std::string> ids;
  for (const auto& step : path.steps) {
    ids.push_back(step.id);
  }
  return ids;
}

void TestFindsAncestorToDescendantPath() {
  PathFinder finder(ExampleGraph());

  const auto path = finder.Find(PathQuery{"20", "1"});
  assert(path.HopCount() == 2);
  assert((Ids(path) == std::vector<std::string>{"20", "6", "1"}));

  assert(path.steps[0].name == "Name A");
  assert(path.steps[0].kind == std::optional<std::string>("Father"));
  assert(path.steps[1].name == "Name B");
  assert(path.steps[1].kind == std::optional<std::string>("Father"));
  assert(path.steps[2].name == "Name C");
  assert(!path.steps[2].kind.has_value());
}

void TestSameEndpointsGiveZeroHopPath() {
  PathFinder finder(ExampleGraph());

  const auto path = finder.Find(PathQuery{"6", "6"});
  assert(path.HopCount() == 0);
  assert(path.steps.size() == 1);
  assert(path.steps[0].id == "6");
  assert(!path.steps[0].kind.has_value());
}

void TestDisconnectedEndpointsReportNoPath() {
  PathFinder finder(ExampleGraph());

  const auto error = ExpectThrow<NoPathFound>([&] { finder.Find(PathQuery{"20", "31"}); });
  assert(error.from() == "20");
  assert(error.to() == "31");

  // edges only lead from ancestor to descendant
  ExpectThrow<NoPathFound>([&] { finder.Find(PathQuery{"1", "20"}); });
}

void TestUnknownIdentifiersNameTheirRole() {
  const auto graph = ExampleGraph();
  PathFinder finder(graph);

  auto ancestor = ExpectThrow<UnknownIdentifier>([&] { finder.Find(PathQuery{"99", "1"}); });
  assert(ancestor.id() == "99");
  assert(ancestor.role() == "ancestor");

  auto descendant = ExpectThrow<UnknownIdentifier>([&] { finder.Find(PathQuery{"20", "98"}); });
  assert(descendant.id() == "98");
  assert(descendant.role() == "descendant");

  auto both = ExpectThrow<UnknownIdentifier>([&] { finder.Find(PathQuery{"99", "98"}); });
  assert(both.id() == "99");

  assert(graph->NodeCount() == 5);
  assert(!graph->Find("99").has_value());
}

void TestRepeatedQueriesAreIdentical() {
  const auto graph = GraphBuilder::BuildFrom({
      MakeRecord("1", "Root", "Father", "3"),
      MakeRecord("1", "Root", "Father", "2"),
      MakeRecord("2", "Left", "Mother", "4"),
      MakeRecord("3", "Right", "Father", "4"),
      MakeRecord("2", "Left", "Parent", "4"),
  });
  PathFinder finder(graph);

  const auto first  = finder.Find(PathQuery{"1", "4"});
  const auto second = finder.Find(PathQuery{"1", "4"});

  assert(Ids(first) == Ids(second));
  assert((Ids(first) == std::vector<std::string>{"1", "2", "4"}));
  assert(first.steps[1].kind == std::optional<std::string>("Mother"));
  assert(second.steps[1].kind == first.steps[1].kind);
}

// Layered pedigree with shortcuts; every reachable pair is checked against
// Floyd-Warshall distances.
void TestHopCountMatchesTrueShortestDistance() {
  constexpr std::size_t kPeople = 24;

  std::vector<RelationshipRecord> records;
  for (std::size_t i = 0; i < kPeople; ++i) {
    for (const std::size_t step : {1, 3, 7}) {
      const auto j = i + step;
      if (j < kPeople && (i * 31 + step) % 4 != 0) {
        records.push_back(MakeRecord(std::to_string(i), "P" + std::to_string(i), "Father", std::to_string(j)));
      }
    }
  }

  constexpr std::size_t kInf = std::numeric_limits<std::size_t>::max() / 4;
  std::vector<std::vector<std::size_t>> dist(kPeople, std::vector<std::size_t>(kPeople, kInf));
  for (std::size_t i = 0; i < kPeople; ++i) {
    dist[i][i] = 0;
  }
  for (const auto& record : records) {
    dist[std::stoul(record.source_id)][std::stoul(record.target_id)] = 1;
  }
  for (std::size_t k = 0; k < kPeople; ++k)
    for (std::size_t i = 0; i < kPeople; ++i)
      for (std::size_t j = 0; j < kPeople; ++j)
        if (dist[i][k] + dist[k][j] < dist[i][j])
          dist[i][j] = dist[i][k] + dist[k][j];

  const auto graph = GraphBuilder::BuildFrom(records);
  PathFinder finder(graph);

  for (std::size_t i = 0; i < kPeople; ++i) {
    for (std::size_t j = 0; j < kPeople; ++j) {
      const PathQuery query{std::to_string(i), std::to_string(j)};
      if (!graph->Find(query.ancestor_id) || !graph->Find(query.descendant_id))
        continue;

      if (dist[i][j] >= kInf) {
        ExpectThrow<NoPathFound>([&] { finder.Find(query); });
        continue;
      }

      const auto path = finder.Find(query);
      assert(path.HopCount() == dist[i][j]);
      assert(path.steps.front().id == query.ancestor_id);
      assert(path.steps.back().id == query.descendant_id);
    }
  }
}

void TestRequiresGraph() {
  ExpectThrow<std::invalid_argument>([] { PathFinder finder(nullptr); });
}

} // namespace

int main() {
  TestFindsAncestorToDescendantPath();
  TestSameEndpointsGiveZeroHopPath();
  TestDisconnectedEndpointsReportNoPath();
  TestUnknownIdentifiersNameTheirRole();
  TestRepeatedQueriesAreIdentical();
  TestHopCountMatchesTrueShortestDistance();
  TestRequiresGraph();

  std::cout << "heritage_unit_path_finder: pass\n";
  return 0;
}
