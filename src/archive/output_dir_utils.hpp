#ifndef LOGARCHIVE_ARCHIVE_OUTPUT_DIR_UTILS_HPP_
#define LOGARCHIVE_ARCHIVE_OUTPUT_DIR_UTILS_HPP_

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace logarchive::archive {

// Creates `output_dir` and any missing parents. An existing directory is
// success. Under dry-run an absent directory is reported in
// `planned_actions` instead of created.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, bool dry_run,
                            std::vector<std::string>& planned_actions, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  if (std::filesystem::exists(output_dir, ec) && !ec) {
    if (!std::filesystem::is_directory(output_dir, ec) || ec) {
      error = "output path exists but is not a directory: " + output_dir.string();
      return false;
    }
    return true;
  }

  if (dry_run) {
    planned_actions.push_back("would create directory " + output_dir.string());
    return true;
  }

  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace logarchive::archive

#endif // LOGARCHIVE_ARCHIVE_OUTPUT_DIR_UTILS_HPP_
