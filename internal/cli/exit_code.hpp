#pragma once

#include <exception>
#include <iosfwd>

namespace heritage::cli {

enum ExitCode : int {
  kExitOk                = 0,
  kExitUsage             = 1,
  kExitDataError         = 2,
  kExitUnknownIdentifier = 3,
  kExitNoPath            = 4,
};

/*
  Converts internal exceptions into process exit codes.
*/
ExitCode ExitCodeFor(const std::exception& e);

/*
  Prints the message for a failed query and returns its exit code.

  A missing relationship is an answer and goes to out. Every other failure is
  written to err as "heritage-pathfind: <reason>", independent of the log level.
*/
ExitCode ReportFailure(const std::exception& e, std::ostream& out, std::ostream& err);

} // namespace heritage::cli
