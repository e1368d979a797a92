#pragma once

#include "archive/file_selector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace logarchive::archive {

struct RemovalReport {
  std::vector<std::filesystem::path> removed;
  // One "<path>: <reason>" line per failed deletion.
  std::vector<std::string> failures;
};

// Deletes every archived source file.
//
// Each deletion is attempted independently; failures are collected rather
// than stopping at the first one. Returns false when any deletion failed,
// with `error` summarising the count and `report.failures` listing each one.
// Under dry-run nothing is deleted and each path is reported instead.
bool RemoveSourceFiles(const std::vector<CandidateFile>& archived, bool dry_run,
                       RemovalReport& report, std::vector<std::string>& planned_actions,
                       std::string& error);

} // namespace logarchive::archive
