#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace logarchive::archive {

inline constexpr std::string_view kArchiveNamePrefix = "logs_archive_";
inline constexpr std::string_view kArchiveNameSuffix = ".tar.gz";

// `logs_archive_<YYYYMMDD_HHMMSS>.tar.gz` in local time.
//
// Resolution is one second: two runs started within the same second produce
// the same name and the later publish replaces the earlier archive.
std::string MakeArchiveName(std::chrono::system_clock::time_point now);

// Prefix/suffix match used by retention pruning. Temp files
// (`<name>.tmp.<tick>.<n>`) do not match.
bool IsArchiveName(std::string_view file_name);

} // namespace logarchive::archive
