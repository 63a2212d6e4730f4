#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cli/arguments.hpp"
#include "internal/cli/exit_code.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/render/path_renderer.hpp"
#include "internal/util/errors.hpp"

using heritage::cli::ReportFailure;
using heritage::observability::StringField;

int main(int argc, char** argv) {
  heritage::cli::Arguments args;
  try {
    args = heritage::cli::ParseArguments(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& e) {
    std::cerr << "heritage-pathfind: " << e.what() << "\n" << heritage::cli::UsageText();
    return heritage::cli::kExitUsage;
  }

  if (args.help) {
    std::cout << heritage::cli::UsageText();
    return heritage::cli::kExitOk;
  }

  // defaults first so configuration errors are logged the same way
  heritage::observability::InitializeLogging(heritage::config::ConfigLoader::Defaults(), args.log_level);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = args.config_path.empty() ? heritage::config::ConfigLoader::Defaults()
                                           : heritage::config::ConfigLoader::LoadFromYaml(args.config_path);

    heritage::observability::InitializeLogging(config, args.log_level);

    // ------------------------------------------------------------
    // Build graph and answer the query
    // ------------------------------------------------------------
    const auto finder = heritage::factory::BuildFinder(config, args.dataset_path);
    const auto path   = finder.Find(args.query);

    heritage::render::PathRenderer::Write(path, std::cout);
    std::cout.flush();

    heritage::observability::ShutdownLogging();
  } catch (const heritage::util::NoPathFound& e) {
    HERITAGE_LOG_WARN("No path", {StringField("ancestor", e.from()), StringField("descendant", e.to())});
    heritage::observability::ShutdownLogging();
    return ReportFailure(e, std::cout, std::cerr);
  } catch (const std::exception& e) {
    HERITAGE_LOG_ERROR("Query failed", {StringField("error", e.what())});
    heritage::observability::ShutdownLogging();
    return ReportFailure(e, std::cout, std::cerr);
  }

  return heritage::cli::kExitOk;
}
