#include "archive/archive_name.hpp"

#include "core/time_utils.hpp"

namespace logarchive::archive {

std::string MakeArchiveName(std::chrono::system_clock::time_point now) {
  return std::string(kArchiveNamePrefix) + core::FormatLocalTimestamp(now, "%Y%m%d_%H%M%S") +
         std::string(kArchiveNameSuffix);
}

bool IsArchiveName(std::string_view file_name) {
  if (file_name.size() <= kArchiveNamePrefix.size() + kArchiveNameSuffix.size()) {
    return false;
  }
  return file_name.substr(0, kArchiveNamePrefix.size()) == kArchiveNamePrefix &&
         file_name.substr(file_name.size() - kArchiveNameSuffix.size()) == kArchiveNameSuffix;
}

} // namespace logarchive::archive
