#include "archive/tar_gz_reader.hpp"

#include "archive/tar_format.hpp"

#include <algorithm>
#include <optional>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

namespace logarchive::archive {

namespace {

// gzFile owner for read-only access.
class GzInput {
public:
  explicit GzInput(const fs::path& path) : gz_(gzopen(path.c_str(), "rb")) {}

  ~GzInput() {
    if (gz_ != nullptr) {
      (void)gzclose(gz_);
    }
  }

  GzInput(const GzInput&) = delete;
  GzInput& operator=(const GzInput&) = delete;

  bool IsOpen() const {
    return gz_ != nullptr;
  }

  // Reads exactly `size` bytes; `short_read` reports a clean end of stream.
  bool ReadExact(char* data, std::size_t size, bool& short_read, std::string& error) {
    short_read = false;
    std::size_t total = 0;
    while (total < size) {
      const int got = gzread(gz_, data + total, static_cast<unsigned>(size - total));
      if (got < 0) {
        int errnum = Z_OK;
        const char* message = gzerror(gz_, &errnum);
        error = std::string("failed while decompressing archive: ") +
                (message == nullptr ? "unknown zlib error" : message);
        return false;
      }
      if (got == 0) {
        short_read = true;
        return total == 0;
      }
      total += static_cast<std::size_t>(got);
    }
    return true;
  }

  bool Skip(std::uint64_t size, std::string& error) {
    std::vector<char> sink(64 * 1024);
    while (size > 0) {
      const auto chunk = static_cast<std::size_t>(
          std::min<std::uint64_t>(size, static_cast<std::uint64_t>(sink.size())));
      bool short_read = false;
      if (!ReadExact(sink.data(), chunk, short_read, error) || short_read) {
        if (error.empty()) {
          error = "archive truncated inside member data";
        }
        return false;
      }
      size -= chunk;
    }
    return true;
  }

private:
  gzFile gz_ = nullptr;
};

bool ReadPayload(GzInput& input, std::uint64_t size_bytes, std::string& payload,
                 std::string& error) {
  payload.assign(static_cast<std::size_t>(size_bytes), '\0');
  bool short_read = false;
  if (size_bytes > 0 &&
      (!input.ReadExact(payload.data(), payload.size(), short_read, error) || short_read)) {
    if (error.empty()) {
      error = "archive truncated inside member data";
    }
    return false;
  }
  return input.Skip(tar::PaddingFor(size_bytes), error);
}

} // namespace

bool ReadTarGzMembers(const fs::path& archive_path, bool include_content,
                      std::vector<ArchiveMember>& members, std::string& error) {
  members.clear();

  GzInput input(archive_path);
  if (!input.IsOpen()) {
    error = "failed to open archive: " + archive_path.string();
    return false;
  }

  std::optional<std::string> pending_long_name;
  for (;;) {
    tar::Block header{};
    bool short_read = false;
    if (!input.ReadExact(header.data(), header.size(), short_read, error)) {
      if (error.empty()) {
        error = "archive truncated inside a header block: " + archive_path.string();
      }
      return false;
    }
    if (short_read) {
      error = "archive ended without terminating blocks: " + archive_path.string();
      return false;
    }

    tar::HeaderFields fields;
    bool end_of_archive = false;
    if (!tar::DecodeHeader(header, fields, end_of_archive, error)) {
      error += " in " + archive_path.string();
      return false;
    }
    if (end_of_archive) {
      return true;
    }

    if (fields.type_flag == tar::kTypeGnuLongName) {
      if (fields.size_bytes > tar::kMaxLongNameBytes) {
        error = "long name record of " + std::to_string(fields.size_bytes) +
                " bytes exceeds the " + std::to_string(tar::kMaxLongNameBytes) +
                "-byte limit in " + archive_path.string();
        return false;
      }
      std::string long_name;
      if (!ReadPayload(input, fields.size_bytes, long_name, error)) {
        return false;
      }
      const std::size_t nul = long_name.find('\0');
      if (nul != std::string::npos) {
        long_name.resize(nul);
      }
      pending_long_name = std::move(long_name);
      continue;
    }

    ArchiveMember member;
    member.path = pending_long_name.has_value() ? *pending_long_name : fields.name;
    pending_long_name.reset();
    member.size_bytes = fields.size_bytes;
    member.mode = fields.mode;
    member.modified_at =
        std::chrono::system_clock::time_point(std::chrono::seconds(fields.mtime_seconds));
    member.is_directory = fields.type_flag == tar::kTypeDirectory;

    if (include_content) {
      if (!ReadPayload(input, fields.size_bytes, member.content, error)) {
        return false;
      }
    } else if (!input.Skip(fields.size_bytes + tar::PaddingFor(fields.size_bytes), error)) {
      return false;
    }

    members.push_back(std::move(member));
  }
}

} // namespace logarchive::archive
