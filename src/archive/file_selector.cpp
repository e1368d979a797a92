#include "archive/file_selector.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace logarchive::archive {

namespace {

bool IsExcludedFile(const fs::path& path, const std::vector<fs::path>& excluded_files) {
  return std::find(excluded_files.begin(), excluded_files.end(), path) != excluded_files.end();
}

} // namespace

bool SelectCandidateFiles(const SelectionOptions& options, std::vector<CandidateFile>& candidates,
                          std::string& error) {
  candidates.clear();

  if (options.source_dir.empty()) {
    error = "source directory cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(options.source_dir, ec) || ec) {
    error = "source directory not found: " + options.source_dir.string();
    return false;
  }
  if (!fs::is_directory(options.source_dir, ec) || ec) {
    error = "source path is not a directory: " + options.source_dir.string();
    return false;
  }

  // Entries are enumerated from the resolved source root and directory
  // symlinks are not followed, so every entry path is physical. The
  // destination and exclusions are resolved the same way before comparing.
  const fs::path source_root = core::ResolvePhysicalPath(options.source_dir);
  const fs::path dest_root = core::ResolvePhysicalPath(options.dest_dir);
  std::vector<fs::path> excluded_files;
  excluded_files.reserve(options.excluded_files.size());
  for (const auto& excluded : options.excluded_files) {
    excluded_files.push_back(core::ResolvePhysicalPath(excluded));
  }

  std::optional<std::chrono::system_clock::time_point> cutoff;
  if (options.min_age_days.has_value()) {
    cutoff = core::AgeCutoff(options.now, *options.min_age_days);
  }

  fs::recursive_directory_iterator it(source_root, ec);
  if (ec) {
    error = "failed to enumerate source directory '" + source_root.string() +
            "': " + ec.message();
    return false;
  }

  const fs::recursive_directory_iterator end{};
  // increment(ec) can leave the iterator at end on failure, so `ec` is
  // checked again once the loop exits.
  for (; it != end; it.increment(ec)) {
    if (ec) {
      error = "failed while enumerating source directory '" + source_root.string() +
              "': " + ec.message();
      return false;
    }

    const fs::path entry_path = it->path().lexically_normal();
    if (!options.dest_dir.empty() && core::IsPathUnder(entry_path, dest_root)) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }

    const fs::file_status status = it->symlink_status(ec);
    if (ec) {
      error = "failed to stat '" + entry_path.string() + "': " + ec.message();
      return false;
    }
    if (!fs::is_regular_file(status)) {
      continue;
    }
    if (IsExcludedFile(entry_path, excluded_files)) {
      continue;
    }

    const fs::file_time_type mtime = it->last_write_time(ec);
    if (ec) {
      error = "failed to read mtime of '" + entry_path.string() + "': " + ec.message();
      return false;
    }
    const auto modified_at = core::ToSystemTime(mtime);
    if (cutoff.has_value() && modified_at > *cutoff) {
      continue;
    }

    const std::uintmax_t size_bytes = it->file_size(ec);
    if (ec) {
      error = "failed to read size of '" + entry_path.string() + "': " + ec.message();
      return false;
    }

    CandidateFile candidate;
    candidate.path = entry_path;
    candidate.relative_path = entry_path.lexically_relative(source_root).generic_string();
    candidate.modified_at = modified_at;
    candidate.size_bytes = size_bytes;
    candidates.push_back(std::move(candidate));
  }

  if (ec) {
    error = "failed while enumerating source directory '" + source_root.string() +
            "': " + ec.message();
    return false;
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const CandidateFile& lhs, const CandidateFile& rhs) {
              return lhs.relative_path < rhs.relative_path;
            });
  return true;
}

} // namespace logarchive::archive
