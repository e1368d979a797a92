#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace logarchive {

// Typed run configuration, filled by the CLI parser and by in-process
// callers such as tests. Unset optionals mean "not requested".
struct ArchiveOptions {
  std::filesystem::path source_dir;
  std::optional<std::uint32_t> min_age_days;
  std::optional<std::filesystem::path> dest_dir;
  bool move_sources = false;
  std::optional<std::uint32_t> retain_days;
  std::optional<std::filesystem::path> history_log;
  bool dry_run = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Destination and history log with defaults applied:
// `<source>/archives` and `<dest>/archive_history.log`.
std::filesystem::path ResolveDestDir(const ArchiveOptions& options);
std::filesystem::path ResolveHistoryLog(const ArchiveOptions& options);

struct ArchiveRunResult {
  bool nothing_to_archive = false;
  std::filesystem::path archive_path;
  std::uint64_t file_count = 0;
  std::uint64_t archive_size_bytes = 0;
  std::uint64_t sources_removed = 0;
  std::uint64_t archives_pruned = 0;
  // Dry-run report, one entry per mutation that was skipped.
  std::vector<std::string> planned_actions;
};

// Runs select -> archive -> record -> (move) -> (retain) and returns a
// process exit code (see core/errors/exit_codes.hpp). Result lines go to
// `out`, failures to `err`, diagnostics to `logger`.
int ExecuteArchiveRun(const ArchiveOptions& options, core::logging::Logger& logger,
                      std::ostream& out, std::ostream& err, ArchiveRunResult* run_result);

} // namespace logarchive
