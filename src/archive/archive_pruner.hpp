#pragma once

#include "archive/source_cleaner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace logarchive::archive {

struct PruneOptions {
  std::filesystem::path dest_dir;
  std::uint32_t retention_days = 0;
  bool dry_run = false;
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
};

// Deletes archives in `dest_dir` (top level only) whose mtime is strictly
// older than `now - retention_days`. Only regular files matching
// IsArchiveName() are considered. Failures are collected in `report` as in
// RemoveSourceFiles().
bool PruneExpiredArchives(const PruneOptions& options, RemovalReport& report,
                          std::vector<std::string>& planned_actions, std::string& error);

} // namespace logarchive::archive
