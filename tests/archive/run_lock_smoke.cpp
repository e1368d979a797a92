#include "../common/assertions.hpp"
#include "../common/file_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "archive/run_lock.hpp"

#include <filesystem>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// PID of a process that has already exited and been reaped.
pid_t DeadPid() {
  const pid_t child = ::fork();
  if (child == 0) {
    ::_exit(0);
  }
  if (child < 0) {
    logarchive::tests::common::Fail("fork failed");
  }
  int status = 0;
  ::waitpid(child, &status, 0);
  return child;
}

ino_t InodeOf(const fs::path& path) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    logarchive::tests::common::Fail("stat failed: " + path.string());
  }
  return info.st_ino;
}

} // namespace

int main() {
  using logarchive::tests::common::AssertContains;
  using logarchive::tests::common::CreateUniqueTempDir;
  using logarchive::tests::common::Fail;
  using logarchive::tests::common::ReadFileToString;
  using logarchive::tests::common::RemovePathBestEffort;
  using logarchive::tests::common::WriteFile;

  const fs::path root = CreateUniqueTempDir("logarchive-run-lock-smoke");
  const fs::path lock_path = root / logarchive::archive::kRunLockFileName;
  std::string error;

  {
    logarchive::archive::RunLock lock(lock_path);
    if (!lock.Acquire(error)) {
      RemovePathBestEffort(root);
      Fail("fresh lock acquire failed: " + error);
    }
    AssertContains(ReadFileToString(lock_path), std::to_string(::getpid()));

    logarchive::archive::RunLock contender(lock_path);
    if (contender.Acquire(error)) {
      RemovePathBestEffort(root);
      Fail("second acquire while the lock is live must fail");
    }
    AssertContains(error, "another logarchive run appears active");
  }
  if (fs::exists(lock_path)) {
    RemovePathBestEffort(root);
    Fail("lock file must be removed when the holder goes out of scope");
  }

  // Lock left by a dead process is taken over in place.
  const pid_t dead_pid = DeadPid();
  WriteFile(lock_path, std::to_string(dead_pid) + "\n");
  const ino_t stale_inode = InodeOf(lock_path);
  {
    logarchive::archive::RunLock lock(lock_path);
    if (!lock.Acquire(error)) {
      RemovePathBestEffort(root);
      Fail("stale lock must be replaced: " + error);
    }
    AssertContains(ReadFileToString(lock_path), std::to_string(::getpid()));
    if (InodeOf(lock_path) != stale_inode) {
      RemovePathBestEffort(root);
      Fail("stale lock must be rewritten in place, not removed and recreated");
    }

    // A second contender that also judged the file stale cannot replace it:
    // the holder's flock refuses it before it reads the owner.
    logarchive::archive::RunLock contender(lock_path);
    if (contender.Acquire(error)) {
      RemovePathBestEffort(root);
      Fail("stale lock taken over by one run must refuse another");
    }
    AssertContains(error, "another logarchive run appears active");
    AssertContains(ReadFileToString(lock_path), std::to_string(::getpid()));
  }

  // A stale file that another process is in the middle of taking over is
  // left alone even though its recorded owner is dead.
  WriteFile(lock_path, std::to_string(dead_pid) + "\n");
  {
    const int racer_fd = ::open(lock_path.c_str(), O_RDWR);
    if (racer_fd < 0 || ::flock(racer_fd, LOCK_EX | LOCK_NB) != 0) {
      RemovePathBestEffort(root);
      Fail("failed to hold the lock file for the takeover race");
    }
    logarchive::archive::RunLock lock(lock_path);
    const bool acquired = lock.Acquire(error);
    ::close(racer_fd);
    if (acquired) {
      RemovePathBestEffort(root);
      Fail("a lock file under another process's flock must not be taken over");
    }
    AssertContains(error, "another logarchive run appears active");
    AssertContains(ReadFileToString(lock_path), std::to_string(dead_pid));
  }

  // Unreadable owner text is treated as stale too.
  WriteFile(lock_path, "not-a-pid\n");
  {
    logarchive::archive::RunLock lock(lock_path);
    if (!lock.Acquire(error)) {
      RemovePathBestEffort(root);
      Fail("garbage lock must be replaced: " + error);
    }
  }

  RemovePathBestEffort(root);
  return 0;
}
