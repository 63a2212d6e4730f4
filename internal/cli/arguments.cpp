#include "arguments.hpp"

#include <algorithm>
#include <stdexcept>

namespace heritage::cli {

namespace {

// "-5" is a person id, not an option
bool IsNegativeNumber(const std::string& arg) {
  return arg.size() > 1 && arg[0] == '-' &&
         std::all_of(arg.begin() + 1, arg.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

std::string UsageText() {
  return "Usage:\n"
         "  heritage-pathfind [--config <config.yaml>] [--log-level <level>] <dataset.csv> -a <ancestor id> -c <descendant id>\n"
         "  heritage-pathfind [--config <config.yaml>] <dataset.csv> <ancestor id> <descendant id>\n"
         "Example: heritage-pathfind path/to/file.csv -a 20 -c 1\n";
}

Arguments ParseArguments(const std::vector<std::string>& args) {
  Arguments                result;
  std::vector<std::string> positional;
  bool                     have_ancestor   = false;
  bool                     have_descendant = false;

  auto value_of = [&](std::size_t& i) -> const std::string& {
    if (i + 1 >= args.size())
      throw std::invalid_argument("missing value for " + args[i]);
    return args[++i];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      result.help = true;
      return result;
    }

    if (arg == "--config") {
      result.config_path = value_of(i);
    } else if (arg == "--log-level") {
      result.log_level = value_of(i);
    } else if (arg == "-a" || arg == "--ancestor") {
      result.query.ancestor_id = value_of(i);
      have_ancestor            = true;
    } else if (arg == "-c" || arg == "--descendant") {
      result.query.descendant_id = value_of(i);
      have_descendant            = true;
    } else if (arg.size() > 1 && arg[0] == '-' && !IsNegativeNumber(arg)) {
      throw std::invalid_argument("unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty())
    throw std::invalid_argument("missing dataset path");
  result.dataset_path = positional[0];

  if (have_ancestor || have_descendant) {
    if (positional.size() != 1)
      throw std::invalid_argument("unexpected argument " + positional[1]);
    if (!have_ancestor)
      throw std::invalid_argument("missing ancestor id (-a)");
    if (!have_descendant)
      throw std::invalid_argument("missing descendant id (-c)");
  } else {
    if (positional.size() != 3)
      throw std::invalid_argument("expected <dataset> <ancestor id> <descendant id>");
    result.query.ancestor_id   = positional[1];
    result.query.descendant_id = positional[2];
  }

  if (result.query.ancestor_id.empty() || result.query.descendant_id.empty())
    throw std::invalid_argument("person ids must not be empty");

  return result;
}

} // namespace heritage::cli
