#include "archive/history_log.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace logarchive::archive {

std::string FormatHistoryEntry(const HistoryEntry& entry) {
  return core::FormatLocalTimestamp(entry.recorded_at, "%Y-%m-%dT%H:%M:%S") + " | " +
         entry.archive_name + " | files=" + std::to_string(entry.file_count) +
         " | size=" + std::to_string(entry.size_bytes) + " | src=" + entry.source_dir.string();
}

bool AppendHistoryEntry(const HistoryEntry& entry, const fs::path& log_path, bool dry_run,
                        std::vector<std::string>& planned_actions, std::string& error) {
  if (log_path.empty()) {
    error = "history log path cannot be empty";
    return false;
  }

  const std::string line = FormatHistoryEntry(entry);
  if (dry_run) {
    planned_actions.push_back("would append to " + log_path.string() + ": " + line);
    return true;
  }

  if (!core::EnsureParentDirectory(log_path, error)) {
    return false;
  }

  std::ofstream out_file(log_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open history log '" + log_path.string() + "' for append";
    return false;
  }

  out_file << line << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while writing history log '" + log_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace logarchive::archive
