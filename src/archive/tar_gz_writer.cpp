#include "archive/tar_gz_writer.hpp"

#include "archive/tar_format.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace logarchive::archive {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

} // namespace

TarGzWriter::~TarGzWriter() {
  if (gz_ != nullptr) {
    (void)gzclose(gz_);
    gz_ = nullptr;
  }
}

bool TarGzWriter::Open(const fs::path& output_path, int compression_level, std::string& error) {
  if (gz_ != nullptr) {
    error = "archive stream already open: " + output_path_.string();
    return false;
  }
  if (compression_level < 0 || compression_level > 9) {
    error = "compression level must be within 0..9";
    return false;
  }

  // "x" maps to O_EXCL so two writers can never share a temp name.
  const std::string mode = "wb" + std::to_string(compression_level) + "x";
  gz_ = gzopen(output_path.c_str(), mode.c_str());
  if (gz_ == nullptr) {
    error = "failed to create archive stream '" + output_path.string() + "'";
    return false;
  }

  output_path_ = output_path;
  members_written_ = 0;
  return true;
}

std::string TarGzWriter::GzErrorText() const {
  int errnum = Z_OK;
  const char* message = gz_ == nullptr ? nullptr : gzerror(gz_, &errnum);
  if (errnum == Z_ERRNO) {
    return std::error_code(errno, std::generic_category()).message();
  }
  return message == nullptr ? "unknown zlib error" : message;
}

bool TarGzWriter::WriteBytes(const char* data, std::size_t size, std::string& error) {
  while (size > 0) {
    const auto chunk = static_cast<unsigned>(std::min<std::size_t>(size, UINT_MAX / 2));
    const int written = gzwrite(gz_, data, chunk);
    if (written <= 0) {
      error = "failed while writing archive '" + output_path_.string() + "': " + GzErrorText();
      return false;
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
  return true;
}

bool TarGzWriter::WriteLongNameRecord(const std::string& member_name, std::string& error) {
  tar::HeaderFields fields;
  fields.name = std::string(tar::kGnuLongNameMarker);
  fields.mode = 0;
  fields.size_bytes = member_name.size() + 1;
  fields.type_flag = tar::kTypeGnuLongName;

  tar::Block header{};
  if (!tar::EncodeHeader(fields, header, error)) {
    return false;
  }
  if (!WriteBytes(header.data(), header.size(), error)) {
    return false;
  }

  // Name payload includes its NUL terminator, then pads to a block.
  std::vector<char> payload(member_name.begin(), member_name.end());
  payload.push_back('\0');
  payload.resize(payload.size() + tar::PaddingFor(payload.size()), '\0');
  return WriteBytes(payload.data(), payload.size(), error);
}

bool TarGzWriter::AddFile(const fs::path& source_path, const std::string& member_name,
                          std::string& error) {
  if (gz_ == nullptr) {
    error = "archive stream is not open";
    return false;
  }

  std::error_code ec;
  const fs::file_status status = fs::status(source_path, ec);
  if (ec || !fs::is_regular_file(status)) {
    error = "archive member source is not a readable regular file: " + source_path.string();
    return false;
  }
  const std::uintmax_t size_bytes = fs::file_size(source_path, ec);
  if (ec) {
    error = "failed to read size of '" + source_path.string() + "': " + ec.message();
    return false;
  }
  const fs::file_time_type mtime = fs::last_write_time(source_path, ec);
  if (ec) {
    error = "failed to read mtime of '" + source_path.string() + "': " + ec.message();
    return false;
  }

  std::ifstream in_file(source_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open archive member source: " + source_path.string();
    return false;
  }

  tar::HeaderFields fields;
  fields.name = member_name;
  fields.mode = static_cast<std::uint32_t>(status.permissions() & fs::perms::mask);
  fields.size_bytes = size_bytes;
  fields.mtime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             core::ToSystemTime(mtime).time_since_epoch())
                             .count();

  std::string prefix;
  std::string name;
  if (!tar::SplitUstarName(member_name, prefix, name)) {
    if (!WriteLongNameRecord(member_name, error)) {
      return false;
    }
    // The ustar header still carries a truncated name for old readers.
    fields.name = member_name.substr(member_name.size() - (tar::kNameFieldSize - 1));
  }

  tar::Block header{};
  if (!tar::EncodeHeader(fields, header, error)) {
    return false;
  }
  if (!WriteBytes(header.data(), header.size(), error)) {
    return false;
  }

  std::vector<char> buffer(kCopyBufferSize);
  std::uint64_t remaining = size_bytes;
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(
        std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
    in_file.read(buffer.data(), want);
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      if (in_file.eof()) {
        error = "file shrank while archiving: " + source_path.string();
      } else {
        error = "failed while reading archive member source: " + source_path.string();
      }
      return false;
    }
    if (!WriteBytes(buffer.data(), static_cast<std::size_t>(read_count), error)) {
      return false;
    }
    remaining -= static_cast<std::uint64_t>(read_count);
  }

  const std::uint64_t padding = tar::PaddingFor(size_bytes);
  if (padding > 0) {
    const tar::Block zeros{};
    if (!WriteBytes(zeros.data(), static_cast<std::size_t>(padding), error)) {
      return false;
    }
  }

  ++members_written_;
  return true;
}

bool TarGzWriter::Finish(std::string& error) {
  if (gz_ == nullptr) {
    error = "archive stream is not open";
    return false;
  }

  const tar::Block zeros{};
  if (!WriteBytes(zeros.data(), zeros.size(), error) ||
      !WriteBytes(zeros.data(), zeros.size(), error)) {
    return false;
  }

  const int close_result = gzclose(gz_);
  gz_ = nullptr;
  if (close_result != Z_OK) {
    error = "failed to finalize archive '" + output_path_.string() + "' (zlib code " +
            std::to_string(close_result) + ")";
    return false;
  }
  return true;
}

} // namespace logarchive::archive
