#include "archive/run_lock.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace logarchive::archive {

namespace {

// A holder releasing between our open() and flock() unlinks the inode we
// opened; each such race costs one retry.
constexpr int kMaxLockAttempts = 8;

std::string ErrnoText(int error_number) {
  return std::error_code(error_number, std::generic_category()).message();
}

bool ReadLockOwner(int fd, pid_t& owner) {
  std::array<char, 32> buffer{};
  const ssize_t count = ::pread(fd, buffer.data(), buffer.size(), 0);
  if (count <= 0) {
    return false;
  }
  std::string_view digits(buffer.data(), static_cast<std::size_t>(count));
  while (!digits.empty() && (digits.back() == '\n' || digits.back() == ' ')) {
    digits.remove_suffix(1);
  }
  long value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size() || value <= 0) {
    return false;
  }
  owner = static_cast<pid_t>(value);
  return true;
}

// kill(pid, 0) succeeds or fails with EPERM for any existing process.
bool IsProcessAlive(pid_t pid) {
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

bool SameInode(int fd, const fs::path& path) {
  struct stat by_fd {};
  struct stat by_path {};
  if (::fstat(fd, &by_fd) != 0 || ::stat(path.c_str(), &by_path) != 0) {
    return false;
  }
  return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

std::string ActiveRunMessage(int fd, const fs::path& lock_path) {
  pid_t owner = 0;
  const std::string pid_text = ReadLockOwner(fd, owner) ? std::to_string(owner) : "unknown";
  return "another logarchive run appears active (pid " + pid_text + ", lock " +
         lock_path.string() + ")";
}

} // namespace

RunLock::RunLock(fs::path lock_path) : lock_path_(std::move(lock_path)) {}

RunLock::~RunLock() {
  Release();
}

bool RunLock::TryLock(bool& retry, std::string& error) {
  retry = false;
  const int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    error = "failed to open run lock '" + lock_path_.string() + "': " + ErrnoText(errno);
    return false;
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int flock_errno = errno;
    if (flock_errno == EWOULDBLOCK) {
      error = ActiveRunMessage(fd, lock_path_);
    } else {
      error = "failed to lock '" + lock_path_.string() + "': " + ErrnoText(flock_errno);
    }
    ::close(fd);
    return false;
  }

  if (!SameInode(fd, lock_path_)) {
    ::close(fd);
    retry = true;
    return false;
  }

  // Everything below runs under the flock, so the stale check and the
  // takeover are one step for any other contender.
  pid_t owner = 0;
  if (ReadLockOwner(fd, owner) && IsProcessAlive(owner)) {
    error = ActiveRunMessage(fd, lock_path_);
    ::close(fd);
    return false;
  }

  const std::string pid_text = std::to_string(static_cast<long>(::getpid())) + "\n";
  if (::ftruncate(fd, 0) != 0) {
    error = "failed to reset run lock '" + lock_path_.string() + "': " + ErrnoText(errno);
    ::close(fd);
    return false;
  }
  const ssize_t written = ::pwrite(fd, pid_text.data(), pid_text.size(), 0);
  if (written != static_cast<ssize_t>(pid_text.size())) {
    const int write_errno = written < 0 ? errno : EIO;
    ::close(fd);
    error = "failed to write run lock '" + lock_path_.string() + "': " + ErrnoText(write_errno);
    return false;
  }

  fd_ = fd;
  held_ = true;
  return true;
}

bool RunLock::Acquire(std::string& error) {
  if (held_) {
    return true;
  }

  for (int attempt = 0; attempt < kMaxLockAttempts; ++attempt) {
    bool retry = false;
    if (TryLock(retry, error)) {
      return true;
    }
    if (!retry) {
      return false;
    }
  }
  error = "run lock '" + lock_path_.string() + "' kept changing while acquiring it";
  return false;
}

void RunLock::Release() {
  if (!held_) {
    return;
  }
  // Unlink before dropping the flock so a waiter that opened the old inode
  // notices the change and retries on a fresh file.
  std::error_code ec;
  fs::remove(lock_path_, ec);
  ::close(fd_);
  fd_ = -1;
  held_ = false;
}

} // namespace logarchive::archive
