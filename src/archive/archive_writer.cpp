#include "archive/archive_writer.hpp"

#include "archive/tar_gz_writer.hpp"
#include "core/fs_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace logarchive::archive {

bool WriteArchive(const std::vector<CandidateFile>& candidates,
                  const ArchiveWriteRequest& request, ArchiveWriteResult& result,
                  std::vector<std::string>& planned_actions, std::string& error) {
  result = ArchiveWriteResult{};
  if (candidates.empty()) {
    return true;
  }
  if (request.dest_dir.empty() || request.archive_name.empty()) {
    error = "archive destination and name are required";
    return false;
  }

  const fs::path final_path = request.dest_dir / request.archive_name;

  if (request.dry_run) {
    std::uint64_t input_bytes = 0;
    for (const auto& candidate : candidates) {
      input_bytes += candidate.size_bytes;
    }
    planned_actions.push_back("would write archive " + final_path.string() + " with " +
                              std::to_string(candidates.size()) + " file(s)");
    result.written = true;
    result.archive_path = final_path;
    result.member_count = candidates.size();
    result.size_bytes = input_bytes;
    return true;
  }

  core::ScopedTempFile temp_file(core::BuildAtomicTempPath(final_path));
  {
    TarGzWriter writer;
    if (!writer.Open(temp_file.Path(), request.compression_level, error)) {
      // Open failed before creating anything we own; the path may belong to
      // another writer.
      temp_file.Release();
      return false;
    }

    for (const auto& candidate : candidates) {
      if (!writer.AddFile(candidate.path, candidate.relative_path, error)) {
        return false;
      }
    }

    if (!writer.Finish(error)) {
      return false;
    }
    result.member_count = writer.MembersWritten();
  }

  std::error_code ec;
  const std::uintmax_t archive_size = fs::file_size(temp_file.Path(), ec);
  if (ec) {
    error = "failed to read size of '" + temp_file.Path().string() + "': " + ec.message();
    return false;
  }

  if (!temp_file.Publish(final_path, error)) {
    return false;
  }

  result.written = true;
  result.archive_path = final_path;
  result.size_bytes = archive_size;
  return true;
}

} // namespace logarchive::archive
