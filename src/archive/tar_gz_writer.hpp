#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <zlib.h>

namespace logarchive::archive {

// Streams a gzip-compressed ustar archive to one output file.
//
// Contract:
// - Open() creates the output exclusively; an existing file is an error.
// - AddFile() copies exactly the number of bytes recorded in the member
//   header. A source that grew since it was stat'ed is cut at that size; one
//   that shrank fails the call.
// - Finish() writes the two terminating zero blocks and closes the gzip
//   stream. Only an archive whose Finish() succeeded is complete.
// - Destruction closes the stream without finishing it; removing the
//   partial file is the caller's job.
class TarGzWriter {
public:
  TarGzWriter() = default;
  ~TarGzWriter();

  TarGzWriter(const TarGzWriter&) = delete;
  TarGzWriter& operator=(const TarGzWriter&) = delete;

  bool Open(const std::filesystem::path& output_path, int compression_level, std::string& error);

  bool AddFile(const std::filesystem::path& source_path, const std::string& member_name,
               std::string& error);

  bool Finish(std::string& error);

  std::uint64_t MembersWritten() const {
    return members_written_;
  }

private:
  bool WriteBytes(const char* data, std::size_t size, std::string& error);
  bool WriteLongNameRecord(const std::string& member_name, std::string& error);
  std::string GzErrorText() const;

  gzFile gz_ = nullptr;
  std::filesystem::path output_path_;
  std::uint64_t members_written_ = 0;
};

} // namespace logarchive::archive
