#pragma once

#include "archive/file_selector.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace logarchive::archive {

struct ArchiveWriteRequest {
  std::filesystem::path dest_dir;
  std::string archive_name;
  bool dry_run = false;
  int compression_level = 6;
};

struct ArchiveWriteResult {
  // False when there was nothing to archive; no other field is meaningful then.
  bool written = false;
  std::filesystem::path archive_path;
  std::uint64_t member_count = 0;
  // Published archive size. Under dry-run, the uncompressed input total.
  std::uint64_t size_bytes = 0;
};

// Writes `candidates` into `<dest_dir>/<archive_name>`.
//
// Contract:
// - No candidates: returns true with `result.written == false`, no I/O.
// - Members are named by `CandidateFile::relative_path`.
// - Content is streamed into a uniquely named sibling temp file which is then
//   renamed onto the final name, so the final name only ever refers to a
//   complete archive.
// - Any failure removes the temp file before returning false.
// - Dry-run creates nothing and reports the would-be archive path.
bool WriteArchive(const std::vector<CandidateFile>& candidates,
                  const ArchiveWriteRequest& request, ArchiveWriteResult& result,
                  std::vector<std::string>& planned_actions, std::string& error);

} // namespace logarchive::archive
