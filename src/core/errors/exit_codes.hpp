#pragma once

namespace logarchive::core::errors {

// Stable process-exit contract for cron jobs and wrappers.
//
// - 0 success, including runs that found nothing to archive
// - 1 generic failure (lock conflict, destination setup)
// - 2 usage error, and a source directory that is missing or not a directory
//
// Archive and deletion failures get their own values so callers can tell a
// run that published nothing from one that published but could not clean up.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kSourceInvalid = 2,
  kArchiveFailed = 10,
  kDeleteFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace logarchive::core::errors
