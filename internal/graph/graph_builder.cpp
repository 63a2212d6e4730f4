#include "internal/graph/graph_builder.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heritage::graph {

using heritage::model::NodeIndex;
using heritage::model::RelationshipRecord;
using heritage::observability::IntField;
using heritage::util::ConflictingPersonData;

GraphBuilder::GraphBuilder() : graph_(std::make_unique<AncestryGraph>()) {}

NodeIndex GraphBuilder::Resolve(const model::PersonId& id,
                                const std::string& name,
                                const std::optional<std::uint32_t>& age,
                                std::size_t line) {
  const auto index  = graph_->AddNodeIfAbsent(id);
  auto&      person = graph_->mutable_person(index);

  // fill unknown attributes, reject changes to known ones

  if (!name.empty()) {
    if (person.name.empty()) {
      person.name = name;
    } else if (person.name != name) {
      throw ConflictingPersonData(line, id, "name '" + name + "' differs from earlier '" + person.name + "'");
    }
  }

  if (age) {
    if (!person.age) {
      person.age = age;
    } else if (*person.age != *age) {
      throw ConflictingPersonData(line, id,
                                  "age " + std::to_string(*age) + " differs from earlier " + std::to_string(*person.age));
    }
  }

  return index;
}

void GraphBuilder::Add(const RelationshipRecord& record) {
  if (record.source_id == record.target_id)
    throw heritage::util::MalformedRecord(record.line, "person " + record.source_id + " is related to itself");

  const auto source = Resolve(record.source_id, record.source_name, record.source_age, record.line);
  const auto target = Resolve(record.target_id, record.target_name, record.target_age, record.line);

  graph_->AddEdge(source, target, record.kind, record.line);
}

std::shared_ptr<const AncestryGraph> GraphBuilder::Build() {
  std::shared_ptr<const AncestryGraph> graph = std::move(graph_);
  graph_ = std::make_unique<AncestryGraph>();
  return graph;
}

std::shared_ptr<const AncestryGraph> GraphBuilder::BuildFrom(const std::vector<RelationshipRecord>& records) {
  GraphBuilder builder;
  for (const auto& record : records) {
    builder.Add(record);
  }

  auto graph = builder.Build();
  HERITAGE_LOG_INFO("Ancestry graph built",
                    {IntField("persons", static_cast<std::int64_t>(graph->NodeCount())),
                     IntField("relationships", static_cast<std::int64_t>(graph->EdgeCount()))});
  return graph;
}

} // namespace heritage::graph
