#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace logarchive::archive {

struct HistoryEntry {
  std::chrono::system_clock::time_point recorded_at{};
  std::string archive_name;
  std::uint64_t file_count = 0;
  std::uint64_t size_bytes = 0;
  std::filesystem::path source_dir;
};

// `{local-iso-ts} | {archive} | files={n} | size={bytes} | src={dir}`,
// without the trailing newline.
std::string FormatHistoryEntry(const HistoryEntry& entry);

// Appends one line to `log_path`, creating the file and its parent directory
// when absent. Under dry-run the line is reported in `planned_actions` and
// the log is left untouched.
bool AppendHistoryEntry(const HistoryEntry& entry, const std::filesystem::path& log_path,
                        bool dry_run, std::vector<std::string>& planned_actions,
                        std::string& error);

} // namespace logarchive::archive
