#ifndef LOGARCHIVE_CORE_TIME_UTILS_HPP_
#define LOGARCHIVE_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace logarchive::core {

constexpr std::chrono::seconds kSecondsPerDay{86'400};

// Canonical UTC timestamp formatter used by diagnostics.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Local wall-clock formatter. `format` is a std::put_time pattern.
// Archive names and history entries are both local time.
inline std::string FormatLocalTimestamp(std::chrono::system_clock::time_point timestamp,
                                        std::string_view format) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
#if defined(_WIN32)
  const errno_t result = localtime_s(&local_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = localtime_r(&epoch_seconds, &local_time);
  if (result == nullptr) {
    return "";
  }
#endif

  const std::string pattern(format);
  std::ostringstream out;
  out << std::put_time(&local_time, pattern.c_str());
  return out.str();
}

inline std::chrono::system_clock::time_point ToSystemTime(std::filesystem::file_time_type value) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(value));
}

inline std::filesystem::file_time_type ToFileTime(std::chrono::system_clock::time_point value) {
  return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
      std::chrono::file_clock::from_sys(value));
}

// `now - days * 86400s`. Used by both the age filter and retention pruning.
inline std::chrono::system_clock::time_point AgeCutoff(std::chrono::system_clock::time_point now,
                                                       std::uint32_t days) {
  return now - kSecondsPerDay * static_cast<std::int64_t>(days);
}

} // namespace logarchive::core

#endif // LOGARCHIVE_CORE_TIME_UTILS_HPP_
