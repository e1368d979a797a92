#include "../common/assertions.hpp"
#include "../common/file_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "archive/archive_pruner.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using logarchive::tests::common::AssertContains;
  using logarchive::tests::common::CreateUniqueTempDir;
  using logarchive::tests::common::Days;
  using logarchive::tests::common::Fail;
  using logarchive::tests::common::ListFileNames;
  using logarchive::tests::common::RemovePathBestEffort;
  using logarchive::tests::common::SetModifiedAt;
  using logarchive::tests::common::WriteFile;

  const fs::path dest = CreateUniqueTempDir("logarchive-archive-pruner-smoke");
  const auto now = std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::now());
  const auto boundary = now - Days(7);

  const std::string expired = "logs_archive_20240101_000000.tar.gz";
  const std::string retained = "logs_archive_20240102_000000.tar.gz";
  const std::string unrelated = "notes.tar.gz";
  const std::string history = "archive_history.log";
  WriteFile(dest / expired, "old");
  SetModifiedAt(dest / expired, boundary - std::chrono::seconds(1));
  WriteFile(dest / retained, "recent");
  SetModifiedAt(dest / retained, boundary + std::chrono::seconds(1));
  WriteFile(dest / unrelated, "other");
  SetModifiedAt(dest / unrelated, now - Days(365));
  WriteFile(dest / history, "history\n");
  SetModifiedAt(dest / history, now - Days(365));

  logarchive::archive::PruneOptions options;
  options.dest_dir = dest;
  options.retention_days = 7;
  options.now = now;
  options.dry_run = true;

  logarchive::archive::RemovalReport report;
  std::vector<std::string> planned;
  std::string error;
  if (!logarchive::archive::PruneExpiredArchives(options, report, planned, error)) {
    RemovePathBestEffort(dest);
    Fail("dry-run prune failed: " + error);
  }
  if (planned.size() != 1 || ListFileNames(dest).size() != 4) {
    RemovePathBestEffort(dest);
    Fail("dry-run prune must report exactly the expired archive and delete nothing");
  }
  AssertContains(planned.front(), expired);

  options.dry_run = false;
  planned.clear();
  if (!logarchive::archive::PruneExpiredArchives(options, report, planned, error)) {
    RemovePathBestEffort(dest);
    Fail("prune failed: " + error);
  }
  if (report.removed.size() != 1 || report.removed.front().filename() != expired) {
    RemovePathBestEffort(dest);
    Fail("prune must delete only the archive older than the boundary");
  }
  const std::vector<std::string> remaining = ListFileNames(dest);
  const std::vector<std::string> expected = {history, retained, unrelated};
  if (remaining != expected) {
    RemovePathBestEffort(dest);
    Fail("prune left an unexpected destination listing");
  }

  // Missing destination on a real run is an error; on dry-run it is empty.
  options.dest_dir = dest / "missing";
  if (logarchive::archive::PruneExpiredArchives(options, report, planned, error)) {
    RemovePathBestEffort(dest);
    Fail("pruning a missing destination must fail");
  }
  options.dry_run = true;
  if (!logarchive::archive::PruneExpiredArchives(options, report, planned, error)) {
    RemovePathBestEffort(dest);
    Fail("dry-run pruning a missing destination must succeed");
  }

  RemovePathBestEffort(dest);
  return 0;
}
