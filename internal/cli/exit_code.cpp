#include "exit_code.hpp"

#include <ostream>

#include "internal/util/errors.hpp"

namespace heritage::cli {

ExitCode ExitCodeFor(const std::exception& e) {
  using namespace heritage::util;

  if (dynamic_cast<const NoPathFound*>(&e)) {
    return kExitNoPath;
  }
  if (dynamic_cast<const UnknownIdentifier*>(&e)) {
    return kExitUnknownIdentifier;
  }

  // DatasetError, DatasetIoError and configuration failures
  return kExitDataError;
}

ExitCode ReportFailure(const std::exception& e, std::ostream& out, std::ostream& err) {
  const auto code = ExitCodeFor(e);
  if (code == kExitNoPath) {
    out << "No direct or indirect relationship found" << std::endl;
  } else {
    err << "heritage-pathfind: " << e.what() << std::endl;
  }
  return code;
}

} // namespace heritage::cli
