#include "internal/factory.hpp"

#include "internal/dataset/dataset_reader.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/observability/logging.hpp"

namespace heritage::factory {

using heritage::observability::IntField;
using heritage::observability::StringField;

std::shared_ptr<const graph::AncestryGraph> LoadGraph(const heritage::runtime::config::RuntimeConfig& config,
                                                      const std::string& dataset_path) {
  dataset::DatasetReader reader(config.dataset());
  const auto records = reader.ReadFile(dataset_path);

  HERITAGE_LOG_INFO("Dataset loaded",
                    {StringField("path", dataset_path), IntField("records", static_cast<std::int64_t>(records.size()))});

  return graph::GraphBuilder::BuildFrom(records);
}

query::PathFinder BuildFinder(const heritage::runtime::config::RuntimeConfig& config,
                              const std::string& dataset_path) {
  return query::PathFinder(LoadGraph(config, dataset_path));
}

} // namespace heritage::factory
