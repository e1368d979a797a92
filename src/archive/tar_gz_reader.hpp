#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace logarchive::archive {

struct ArchiveMember {
  std::string path;
  std::uint64_t size_bytes = 0;
  std::uint32_t mode = 0;
  std::chrono::system_clock::time_point modified_at{};
  bool is_directory = false;
  // Filled only when contents were requested.
  std::string content;
};

// Reads every member of a gzip-compressed tar archive.
//
// Contract:
// - Accepts ustar headers and GNU long-name records.
// - Validates every header checksum; a truncated stream is an error.
// - `include_content` controls whether member bytes are kept in memory.
bool ReadTarGzMembers(const std::filesystem::path& archive_path, bool include_content,
                      std::vector<ArchiveMember>& members, std::string& error);

} // namespace logarchive::archive
