#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/graph/ancestry_graph.hpp"
#include "internal/query/path_finder.hpp"

namespace heritage::factory {

/*
  Composition root: dataset file -> records -> graph -> finder.

  Everything is read and validated up front; any dataset error propagates
  before a finder exists.
*/
std::shared_ptr<const graph::AncestryGraph> LoadGraph(const heritage::runtime::config::RuntimeConfig& config,
                                                      const std::string& dataset_path);

query::PathFinder BuildFinder(const heritage::runtime::config::RuntimeConfig& config,
                              const std::string& dataset_path);

} // namespace heritage::factory
