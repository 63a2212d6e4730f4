#include "internal/graph/graph_builder.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using heritage::graph::GraphBuilder;
using heritage::model::RelationshipRecord;
using heritage::util::ConflictingPersonData;
using heritage::util::MalformedRecord;

RelationshipRecord MakeRecord(std::size_t line,
                              const std::string& source,
                              const std::string& source_name,
                              const std::string& kind,
                              const std::string& target,
                              const std::string& target_name = "",
                              std::optional<std::uint32_t> source_age = std::nullopt) {
  RelationshipRecord record;
  record.line        = line;
  record.source_id   = source;
  record.source_name = source_name;
  record.source_age  = source_age;
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

void TestCountsMatchDistinctIdsAndRecords() {
  const std::vector<RelationshipRecord> records = {
      MakeRecord(2, "20", "Name A", "Father", "6"),
      MakeRecord(3, "6", "Name B", "Father", "1"),
      MakeRecord(4, "21", "Name D", "Mother", "6"),
      MakeRecord(5, "20", "Name A", "Father", "6"), // restated
  };

  const auto graph = GraphBuilder::BuildFrom(records);

  std::set<std::string> ids;
  for (const auto& record : records) {
    ids.insert(record.source_id);
    ids.insert(record.target_id);
  }

  assert(graph->NodeCount() == ids.size());
  assert(graph->EdgeCount() == records.size());
  assert(graph->OutEdges(*graph->Find("20")).size() == 2);
}

void TestFirstOccurrencePopulatesAttributes() {
  const auto graph = GraphBuilder::BuildFrom({
      MakeRecord(2, "20", "Name A", "Father", "6", "", 61),
      MakeRecord(3, "20", "", "Father", "7"),
      MakeRecord(4, "6", "Name B", "Father", "1", "Name C"),
  });

  const auto& a = graph->person(*graph->Find("20"));
  assert(a.name == "Name A");
  assert(a.age.has_value() && *a.age == 61);

  // target-only person picks up its name from the mapped target column
  assert(graph->person(*graph->Find("1")).name == "Name C");
  // still unnamed
  assert(graph->person(*graph->Find("7")).name.empty());
}

void TestLaterRecordFillsUnknownName() {
  const auto graph = GraphBuilder::BuildFrom({
      MakeRecord(2, "20", "Name A", "Father", "6"),
      MakeRecord(3, "6", "Name B", "Father", "1"),
  });

  assert(graph->person(*graph->Find("6")).name == "Name B");
}

void TestConflictingNameIsRejected() {
  const auto error = ExpectThrow<ConflictingPersonData>([] {
    GraphBuilder::BuildFrom({
        MakeRecord(2, "20", "Name A", "Father", "6"),
        MakeRecord(3, "20", "Someone Else", "Father", "7"),
    });
  });

  assert(error.line() == 3);
  assert(error.id() == "20");
}

void TestConflictingAgeIsRejected() {
  const auto error = ExpectThrow<ConflictingPersonData>([] {
    GraphBuilder::BuildFrom({
        MakeRecord(2, "20", "Name A", "Father", "6", "", 61),
        MakeRecord(7, "20", "Name A", "Father", "7", "", 62),
    });
  });

  assert(error.line() == 7);
}

void TestTargetNameConflictsWithSourceName() {
  ExpectThrow<ConflictingPersonData>([] {
    GraphBuilder::BuildFrom({
        MakeRecord(2, "6", "Name B", "Father", "1"),
        MakeRecord(3, "20", "Name A", "Father", "6", "Name X"),
    });
  });
}

void TestSelfReferenceIsRejected() {
  const auto error = ExpectThrow<MalformedRecord>([] {
    GraphBuilder builder;
    builder.Add(MakeRecord(9, "6", "Name B", "Father", "6"));
  });
  assert(error.line() == 9);
}

void TestBuildHandsOutGraphAndResets() {
  GraphBuilder builder;
  builder.Add(MakeRecord(2, "20", "Name A", "Father", "6"));

  const auto first = builder.Build();
  assert(first->NodeCount() == 2);

  const auto second = builder.Build();
  assert(second->NodeCount() == 0);
  assert(first->EdgeCount() == 1);
}

void TestResultDoesNotDependOnInputOrderBeyondFirstOccurrence() {
  const auto forward = GraphBuilder::BuildFrom({
      MakeRecord(2, "20", "Name A", "Father", "6"),
      MakeRecord(3, "6", "Name B", "Father", "1"),
  });
  const auto reverse = GraphBuilder::BuildFrom({
      MakeRecord(2, "6", "Name B", "Father", "1"),
      MakeRecord(3, "20", "Name A", "Father", "6"),
  });

  assert(forward->NodeCount() == reverse->NodeCount());
  assert(forward->EdgeCount() == reverse->EdgeCount());
  for (const char* id : {"20", "6", "1"}) {
    assert(forward->person(*forward->Find(id)).name == reverse->person(*reverse->Find(id)).name);
  }
}

} // namespace

int main() {
  TestCountsMatchDistinctIdsAndRecords();
  TestFirstOccurrencePopulatesAttributes();
  TestLaterRecordFillsUnknownName();
  TestConflictingNameIsRejected();
  TestConflictingAgeIsRejected();
  TestTargetNameConflictsWithSourceName();
  TestSelfReferenceIsRejected();
  TestBuildHandsOutGraphAndResets();
  TestResultDoesNotDependOnInputOrderBeyondFirstOccurrence();

  std::cout << "heritage_unit_graph_builder: pass\n";
  return 0;
}
