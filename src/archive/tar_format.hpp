#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace logarchive::archive::tar {

// POSIX ustar layout (IEEE Std 1003.1-1988 plus the 2001 prefix field).
constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kNameFieldSize = 100;
constexpr std::size_t kPrefixFieldSize = 155;
constexpr char kTypeRegularFile = '0';
constexpr char kTypeDirectory = '5';
constexpr char kTypeGnuLongName = 'L';
constexpr std::string_view kGnuLongNameMarker = "././@LongLink";
// Largest size representable in the 11-digit octal size field. Larger sizes
// are written in the GNU base-256 form.
constexpr std::uint64_t kMaxOctalSize = 077777777777ULL;

// Upper bound on a GNU long-name payload; real paths stay far below it.
constexpr std::uint64_t kMaxLongNameBytes = 64 * 1024;

using Block = std::array<char, kBlockSize>;

struct HeaderFields {
  std::string name;
  std::uint32_t mode = 0644;
  std::uint64_t size_bytes = 0;
  std::int64_t mtime_seconds = 0;
  char type_flag = kTypeRegularFile;
};

// Splits `path` into ustar prefix/name fields. Returns false when the path
// cannot be represented without a long-name record.
bool SplitUstarName(std::string_view path, std::string& prefix, std::string& name);

// Builds one header block with a valid checksum. The caller decides whether
// `fields.name` fits (see SplitUstarName); names are split here when needed
// and truncated only for the GNU long-name marker record.
bool EncodeHeader(const HeaderFields& fields, Block& block, std::string& error);

// Parses a header block. Returns false with `error` on checksum mismatch or
// malformed numeric fields. An all-zero block yields `end_of_archive = true`.
bool DecodeHeader(const Block& block, HeaderFields& fields, bool& end_of_archive,
                  std::string& error);

// Unsigned sum of header bytes with the checksum field read as spaces.
std::uint32_t ComputeChecksum(const Block& block);

constexpr std::uint64_t PaddingFor(std::uint64_t size_bytes) {
  return (kBlockSize - (size_bytes % kBlockSize)) % kBlockSize;
}

} // namespace logarchive::archive::tar
