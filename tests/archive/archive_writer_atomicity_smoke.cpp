#include "../common/assertions.hpp"
#include "../common/file_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "archive/archive_writer.hpp"
#include "archive/file_selector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using logarchive::tests::common::AnyNameContains;
  using logarchive::tests::common::CreateUniqueTempDir;
  using logarchive::tests::common::Fail;
  using logarchive::tests::common::ListFileNames;
  using logarchive::tests::common::RemovePathBestEffort;
  using logarchive::tests::common::WriteFile;

  const fs::path root = CreateUniqueTempDir("logarchive-archive-writer-atomicity-smoke");
  const fs::path source = root / "logs";
  const fs::path dest = root / "archives";
  fs::create_directories(dest);

  WriteFile(source / "a.log", std::string(100'000, 'a'));
  WriteFile(source / "b.log", "second\n");
  WriteFile(source / "c.log", "third\n");

  logarchive::archive::SelectionOptions selection;
  selection.source_dir = source;
  selection.dest_dir = dest;
  std::vector<logarchive::archive::CandidateFile> candidates;
  std::string error;
  if (!logarchive::archive::SelectCandidateFiles(selection, candidates, error) ||
      candidates.size() != 3) {
    RemovePathBestEffort(root);
    Fail("fixture selection failed: " + error);
  }

  logarchive::archive::ArchiveWriteRequest request;
  request.dest_dir = dest;
  request.archive_name = "logs_archive_20240101_000000.tar.gz";
  logarchive::archive::ArchiveWriteResult result;
  std::vector<std::string> planned;

  // A candidate that vanishes after selection fails the write mid-stream,
  // after the first member has already been written to the temp file.
  fs::remove(source / "b.log");
  if (logarchive::archive::WriteArchive(candidates, request, result, planned, error)) {
    RemovePathBestEffort(root);
    Fail("write with a vanished candidate must fail");
  }
  logarchive::tests::common::AssertContains(error, "b.log");
  const std::vector<std::string> after_failure = ListFileNames(dest);
  if (!after_failure.empty()) {
    RemovePathBestEffort(root);
    Fail("failed write must leave the destination empty");
  }

  // The same candidates succeed once the file is back, and leave exactly the
  // published archive behind.
  WriteFile(source / "b.log", "second\n");
  if (!logarchive::archive::WriteArchive(candidates, request, result, planned, error)) {
    RemovePathBestEffort(root);
    Fail("retry after restoring the candidate failed: " + error);
  }
  const std::vector<std::string> after_success = ListFileNames(dest);
  if (after_success != std::vector<std::string>{request.archive_name} ||
      AnyNameContains(after_success, ".tmp.")) {
    RemovePathBestEffort(root);
    Fail("successful write must leave only the published archive");
  }
  RemovePathBestEffort(dest);
  fs::create_directories(dest);

  // Dry-run reports the would-be archive and touches nothing.
  request.dry_run = true;
  planned.clear();
  if (!logarchive::archive::WriteArchive(candidates, request, result, planned, error)) {
    RemovePathBestEffort(root);
    Fail("dry-run write failed: " + error);
  }
  if (!result.written || result.archive_path != dest / request.archive_name ||
      planned.size() != 1 || !ListFileNames(dest).empty()) {
    RemovePathBestEffort(root);
    Fail("dry-run write must only report the would-be archive");
  }
  logarchive::tests::common::AssertContains(planned.front(), "would write archive");

  // No candidates: nothing happens at all.
  request.dry_run = false;
  planned.clear();
  const std::vector<logarchive::archive::CandidateFile> none;
  if (!logarchive::archive::WriteArchive(none, request, result, planned, error) ||
      result.written || !ListFileNames(dest).empty()) {
    RemovePathBestEffort(root);
    Fail("empty candidate list must be a no-op");
  }

  RemovePathBestEffort(root);
  return 0;
}
