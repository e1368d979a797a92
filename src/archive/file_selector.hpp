#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace logarchive::archive {

// One regular file chosen for the next archive.
struct CandidateFile {
  std::filesystem::path path;          // absolute, normalised
  std::string relative_path;           // generic form, relative to the source root
  std::chrono::system_clock::time_point modified_at{};
  std::uintmax_t size_bytes = 0;
};

struct SelectionOptions {
  std::filesystem::path source_dir;
  std::filesystem::path dest_dir;
  // Keep only files whose mtime is at or before `now - min_age_days`.
  std::optional<std::uint32_t> min_age_days;
  // Individual files never selected, e.g. a history log kept in the source tree.
  std::vector<std::filesystem::path> excluded_files;
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
};

// Walks `source_dir` recursively and returns the candidates sorted by
// relative path.
//
// Contract:
// - Only regular files qualify; symlinks are neither followed nor selected.
// - Everything under `dest_dir` is skipped, so repeated runs never pick up
//   earlier archives, the history log or the run lock.
// - A file is dropped by the age filter when its mtime is strictly after the
//   cutoff.
// - Returns false with `error` populated when the source directory is
//   missing, not a directory, or cannot be enumerated.
bool SelectCandidateFiles(const SelectionOptions& options, std::vector<CandidateFile>& candidates,
                          std::string& error);

} // namespace logarchive::archive
