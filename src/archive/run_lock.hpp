#pragma once

#include <filesystem>
#include <string>

namespace logarchive::archive {

inline constexpr const char* kRunLockFileName = ".logarchive.lock";

// Advisory single-run lock kept in the archive directory.
//
// The lock file holds the owner's PID, and the owner keeps an exclusive
// flock(2) on it for the whole run. Acquire() fails when another process holds
// that flock, or when an unlocked file still names a live process. A file
// naming a dead process is stale and taken over in place while locked, so two
// contenders can never both replace it. The lock is released on destruction.
class RunLock {
public:
  explicit RunLock(std::filesystem::path lock_path);
  ~RunLock();

  RunLock(const RunLock&) = delete;
  RunLock& operator=(const RunLock&) = delete;

  bool Acquire(std::string& error);
  void Release();

  bool Held() const {
    return held_;
  }

  const std::filesystem::path& Path() const {
    return lock_path_;
  }

private:
  bool TryLock(bool& retry, std::string& error);

  std::filesystem::path lock_path_;
  int fd_ = -1;
  bool held_ = false;
};

} // namespace logarchive::archive
