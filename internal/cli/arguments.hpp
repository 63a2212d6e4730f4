#pragma once

#include <string>
#include <vector>

#include "internal/model/ancestry_path.hpp"

namespace heritage::cli {

struct Arguments {
  bool help = false;

  std::string config_path;
  std::string log_level;
  std::string dataset_path;

  model::PathQuery query;
};

/*
  Accepts
    [--config <file>] [--log-level <level>] <dataset> -a <ancestor> -c <descendant>
    [--config <file>] [--log-level <level>] <dataset> <ancestor> <descendant>
    --help | -h

  Throws std::invalid_argument describing the first problem.
*/
Arguments ParseArguments(const std::vector<std::string>& args);

std::string UsageText();

} // namespace heritage::cli
