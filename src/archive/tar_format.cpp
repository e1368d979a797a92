#include "archive/tar_format.hpp"

#include <algorithm>
#include <cstring>

namespace logarchive::archive::tar {

namespace {

// Field offsets inside the 512-byte header.
constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kTypeFlagOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;
constexpr std::size_t kPrefixOffset = 345;

constexpr std::size_t kModeFieldSize = 8;
constexpr std::size_t kIdFieldSize = 8;
constexpr std::size_t kSizeFieldSize = 12;
constexpr std::size_t kMtimeFieldSize = 12;
constexpr std::size_t kChecksumFieldSize = 8;

constexpr char kUstarMagic[] = "ustar";
constexpr char kUstarVersion[] = "00";

// Writes `value` as zero-padded octal using `field_size - 1` digits plus NUL.
bool WriteOctal(Block& block, std::size_t offset, std::size_t field_size, std::uint64_t value) {
  const std::size_t digits = field_size - 1;
  for (std::size_t i = 0; i < digits; ++i) {
    block[offset + digits - 1 - i] = static_cast<char>('0' + (value & 7U));
    value >>= 3;
  }
  block[offset + digits] = '\0';
  return value == 0;
}

// GNU base-256 form for values the octal digits cannot hold: the first byte
// is 0x80, the remaining bytes carry the value big-endian.
void WriteBase256(Block& block, std::size_t offset, std::size_t field_size, std::uint64_t value) {
  for (std::size_t i = field_size - 1; i > 0; --i) {
    block[offset + i] = static_cast<char>(value & 0xFFU);
    value >>= 8;
  }
  block[offset] = static_cast<char>(0x80);
}

void WriteNumeric(Block& block, std::size_t offset, std::size_t field_size, std::uint64_t value) {
  if (!WriteOctal(block, offset, field_size, value)) {
    WriteBase256(block, offset, field_size, value);
  }
}

bool ReadOctal(const Block& block, std::size_t offset, std::size_t field_size,
               std::uint64_t& value) {
  value = 0;
  const auto lead = static_cast<unsigned char>(block[offset]);
  if (lead == 0x80U) {
    for (std::size_t i = 1; i < field_size; ++i) {
      if ((value >> 56) != 0) {
        return false;
      }
      value = (value << 8) | static_cast<unsigned char>(block[offset + i]);
    }
    return true;
  }
  if ((lead & 0x80U) != 0) {
    // Negative base-256 values are never valid for the fields read here.
    return false;
  }
  std::size_t i = 0;
  while (i < field_size && block[offset + i] == ' ') {
    ++i;
  }
  bool seen_digit = false;
  for (; i < field_size; ++i) {
    const char c = block[offset + i];
    if (c == '\0' || c == ' ') {
      break;
    }
    if (c < '0' || c > '7') {
      return false;
    }
    value = (value << 3) | static_cast<std::uint64_t>(c - '0');
    seen_digit = true;
  }
  return seen_digit;
}

void CopyField(Block& block, std::size_t offset, std::size_t field_size, std::string_view text) {
  const std::size_t count = std::min(field_size, text.size());
  std::memcpy(block.data() + offset, text.data(), count);
}

std::string ReadString(const Block& block, std::size_t offset, std::size_t field_size) {
  const char* begin = block.data() + offset;
  const char* end = static_cast<const char*>(std::memchr(begin, '\0', field_size));
  return std::string(begin, end == nullptr ? begin + field_size : end);
}

} // namespace

bool SplitUstarName(std::string_view path, std::string& prefix, std::string& name) {
  prefix.clear();
  name.clear();
  if (path.size() <= kNameFieldSize) {
    name = std::string(path);
    return true;
  }

  // Split on the last '/' that leaves both halves within their fields.
  for (std::size_t pos = path.rfind('/'); pos != std::string_view::npos && pos > 0;
       pos = path.rfind('/', pos - 1)) {
    const std::string_view head = path.substr(0, pos);
    const std::string_view tail = path.substr(pos + 1);
    if (tail.size() > kNameFieldSize || tail.empty()) {
      return false;
    }
    if (head.size() <= kPrefixFieldSize) {
      prefix = std::string(head);
      name = std::string(tail);
      return true;
    }
  }
  return false;
}

std::uint32_t ComputeChecksum(const Block& block) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < kBlockSize; ++i) {
    if (i >= kChecksumOffset && i < kChecksumOffset + kChecksumFieldSize) {
      sum += static_cast<unsigned char>(' ');
    } else {
      sum += static_cast<unsigned char>(block[i]);
    }
  }
  return sum;
}

bool EncodeHeader(const HeaderFields& fields, Block& block, std::string& error) {
  block.fill('\0');

  if (fields.name.empty()) {
    error = "tar member name cannot be empty";
    return false;
  }

  std::string prefix;
  std::string name;
  if (fields.type_flag == kTypeGnuLongName) {
    name = fields.name.substr(0, kNameFieldSize - 1);
  } else if (!SplitUstarName(fields.name, prefix, name)) {
    error = "tar member name does not fit ustar fields: " + fields.name;
    return false;
  }

  if (fields.mtime_seconds < 0) {
    error = "tar member has mtime before the epoch: " + fields.name;
    return false;
  }

  CopyField(block, kNameOffset, kNameFieldSize, name);
  WriteOctal(block, kModeOffset, kModeFieldSize, fields.mode & 07777U);
  WriteOctal(block, kUidOffset, kIdFieldSize, 0);
  WriteOctal(block, kGidOffset, kIdFieldSize, 0);
  WriteNumeric(block, kSizeOffset, kSizeFieldSize, fields.size_bytes);
  if (!WriteOctal(block, kMtimeOffset, kMtimeFieldSize,
                  static_cast<std::uint64_t>(fields.mtime_seconds))) {
    error = "tar member mtime out of range: " + fields.name;
    return false;
  }
  block[kTypeFlagOffset] = fields.type_flag;
  std::memcpy(block.data() + kMagicOffset, kUstarMagic, sizeof(kUstarMagic));
  std::memcpy(block.data() + kVersionOffset, kUstarVersion, 2);
  CopyField(block, kPrefixOffset, kPrefixFieldSize, prefix);

  // Six octal digits, NUL, space: the layout GNU and BSD tar both emit.
  const std::uint32_t checksum = ComputeChecksum(block);
  WriteOctal(block, kChecksumOffset, 7, checksum);
  block[kChecksumOffset + 7] = ' ';
  return true;
}

bool DecodeHeader(const Block& block, HeaderFields& fields, bool& end_of_archive,
                  std::string& error) {
  end_of_archive = std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
  if (end_of_archive) {
    return true;
  }

  std::uint64_t stored_checksum = 0;
  if (!ReadOctal(block, kChecksumOffset, kChecksumFieldSize, stored_checksum)) {
    error = "tar header has malformed checksum field";
    return false;
  }
  if (stored_checksum != ComputeChecksum(block)) {
    error = "tar header checksum mismatch";
    return false;
  }

  std::uint64_t mode = 0;
  std::uint64_t size_bytes = 0;
  std::uint64_t mtime_seconds = 0;
  if (!ReadOctal(block, kModeOffset, kModeFieldSize, mode) ||
      !ReadOctal(block, kSizeOffset, kSizeFieldSize, size_bytes) ||
      !ReadOctal(block, kMtimeOffset, kMtimeFieldSize, mtime_seconds)) {
    error = "tar header has malformed numeric field";
    return false;
  }

  const std::string name = ReadString(block, kNameOffset, kNameFieldSize);
  const std::string prefix = ReadString(block, kPrefixOffset, kPrefixFieldSize);
  fields.name = prefix.empty() ? name : prefix + "/" + name;
  fields.mode = static_cast<std::uint32_t>(mode);
  fields.size_bytes = size_bytes;
  fields.mtime_seconds = static_cast<std::int64_t>(mtime_seconds);
  fields.type_flag = block[kTypeFlagOffset] == '\0' ? kTypeRegularFile : block[kTypeFlagOffset];
  return true;
}

} // namespace logarchive::archive::tar
