#include "archive/archive_pruner.hpp"

#include "archive/archive_name.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace logarchive::archive {

namespace {

bool CollectExpiredArchives(const PruneOptions& options, std::vector<fs::path>& expired,
                            std::string& error) {
  const auto cutoff = core::AgeCutoff(options.now, options.retention_days);

  std::error_code ec;
  fs::directory_iterator it(options.dest_dir, ec);
  if (ec) {
    error = "failed to list archive directory '" + options.dest_dir.string() +
            "': " + ec.message();
    return false;
  }

  const fs::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!IsArchiveName(it->path().filename().string())) {
      continue;
    }
    const fs::file_status status = it->symlink_status(ec);
    if (ec) {
      error = "failed to stat '" + it->path().string() + "': " + ec.message();
      return false;
    }
    if (!fs::is_regular_file(status)) {
      continue;
    }
    const fs::file_time_type mtime = it->last_write_time(ec);
    if (ec) {
      error = "failed to read mtime of '" + it->path().string() + "': " + ec.message();
      return false;
    }
    if (core::ToSystemTime(mtime) < cutoff) {
      expired.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while listing archive directory '" + options.dest_dir.string() +
            "': " + ec.message();
    return false;
  }

  std::sort(expired.begin(), expired.end());
  return true;
}

} // namespace

bool PruneExpiredArchives(const PruneOptions& options, RemovalReport& report,
                          std::vector<std::string>& planned_actions, std::string& error) {
  report = RemovalReport{};
  if (options.dest_dir.empty()) {
    error = "archive directory cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::is_directory(options.dest_dir, ec) || ec) {
    // Nothing has ever been archived here (dry-run of a first run).
    if (options.dry_run) {
      return true;
    }
    error = "archive directory not found: " + options.dest_dir.string();
    return false;
  }

  std::vector<fs::path> expired;
  if (!CollectExpiredArchives(options, expired, error)) {
    return false;
  }

  for (const auto& path : expired) {
    if (options.dry_run) {
      planned_actions.push_back("would delete expired archive " + path.string());
      continue;
    }
    if (!fs::remove(path, ec) || ec) {
      report.failures.push_back(path.string() + ": " +
                                (ec ? ec.message() : "archive disappeared before deletion"));
      ec.clear();
      continue;
    }
    report.removed.push_back(path);
  }

  if (!report.failures.empty()) {
    error = "failed to delete " + std::to_string(report.failures.size()) + " of " +
            std::to_string(expired.size()) + " expired archive(s)";
    return false;
  }
  return true;
}

} // namespace logarchive::archive
