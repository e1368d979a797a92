#pragma once

#include "logarchive/archive_run.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace logarchive::cli {

// Parses the archive invocation `<log-dir> [flags...]` into `options`.
// Unknown flags, duplicate positionals, and values that are not
// non-negative integers are usage errors.
bool ParseArchiveOptions(const std::vector<std::string_view>& args, ArchiveOptions& options,
                         std::string& error);

// Routes `logarchive` invocations and returns process exit codes:
//   0  => success, including nothing to archive
//   1  => generic failure
//   2  => usage error, or source directory missing / not a directory
//   10 => archive or history write failed
//   20 => source or archive deletion failed
//
// `list`, `version` and `help` are reserved first arguments; everything else
// is treated as an archive run whose first positional is the log directory.
int Dispatch(int argc, char** argv);

} // namespace logarchive::cli
