#include "../common/assertions.hpp"
#include "../common/file_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "archive/file_selector.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> RelativePaths(const std::vector<logarchive::archive::CandidateFile>& files) {
  std::vector<std::string> paths;
  for (const auto& file : files) {
    paths.push_back(file.relative_path);
  }
  return paths;
}

} // namespace

int main() {
  using logarchive::tests::common::AssertTrue;
  using logarchive::tests::common::CreateUniqueTempDir;
  using logarchive::tests::common::Days;
  using logarchive::tests::common::Fail;
  using logarchive::tests::common::RemovePathBestEffort;
  using logarchive::tests::common::SetModifiedAt;
  using logarchive::tests::common::WriteAgedFile;
  using logarchive::tests::common::WriteFile;

  const fs::path root = CreateUniqueTempDir("logarchive-file-selector-smoke");
  const fs::path source = root / "logs";
  const fs::path dest = source / "archives";
  const auto now = std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::now());
  const auto cutoff = now - Days(5);

  // Exactly at the cutoff qualifies; one second newer does not.
  WriteFile(source / "at_cutoff.log", "at\n");
  SetModifiedAt(source / "at_cutoff.log", cutoff);
  WriteFile(source / "just_newer.log", "newer\n");
  SetModifiedAt(source / "just_newer.log", cutoff + std::chrono::seconds(1));
  WriteAgedFile(source / "nested/deep/old.log", "old\n", Days(30), now);
  WriteAgedFile(source / "fresh.log", "fresh\n", Days(1), now);
  WriteAgedFile(dest / "logs_archive_20000101_000000.tar.gz", "prior\n", Days(30), now);
  WriteAgedFile(dest / "archive_history.log", "history\n", Days(30), now);
  WriteAgedFile(root / "outside.log", "outside\n", Days(30), now);

  std::error_code ec;
  fs::create_symlink(root / "outside.log", source / "link.log", ec);
  if (ec) {
    RemovePathBestEffort(root);
    Fail("failed to create symlink fixture");
  }

  logarchive::archive::SelectionOptions options;
  options.source_dir = source;
  options.dest_dir = dest;
  options.min_age_days = 5;
  options.now = now;

  std::vector<logarchive::archive::CandidateFile> candidates;
  std::string error;
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles failed: " + error);
  }

  const std::vector<std::string> aged = RelativePaths(candidates);
  const std::vector<std::string> expected_aged = {"at_cutoff.log", "nested/deep/old.log"};
  if (aged != expected_aged) {
    RemovePathBestEffort(root);
    Fail("age filter selected an unexpected set of files");
  }
  AssertTrue(candidates.front().path.is_absolute(), "candidate paths must be absolute");
  AssertTrue(candidates.front().size_bytes == 3, "candidate size must match file content");

  // Without a threshold every regular file outside the destination qualifies.
  options.min_age_days.reset();
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles without threshold failed: " + error);
  }
  const std::vector<std::string> expected_all = {"at_cutoff.log", "fresh.log", "just_newer.log",
                                                 "nested/deep/old.log"};
  if (RelativePaths(candidates) != expected_all) {
    RemovePathBestEffort(root);
    Fail("unfiltered selection must include all regular files outside the destination");
  }

  // A history log kept inside the source tree is never archived.
  WriteFile(source / "archive_history.log", "history\n");
  options.excluded_files.push_back(source / "archive_history.log");
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles with exclusions failed: " + error);
  }
  if (RelativePaths(candidates) != expected_all) {
    RemovePathBestEffort(root);
    Fail("excluded history log must not be selected");
  }

  // A destination given with a trailing separator or relative segments is
  // still recognised.
  options.dest_dir = source / "nested" / ".." / "archives" / "";
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles with unnormalised destination failed: " + error);
  }
  if (RelativePaths(candidates) != expected_all) {
    RemovePathBestEffort(root);
    Fail("destination exclusion must survive path normalisation");
  }

  // The destination and exclusions are matched physically, so spelling them
  // through a directory symlink still keeps them out of the selection.
  const fs::path alias = root / "alias";
  fs::create_directory_symlink(source, alias, ec);
  if (ec) {
    RemovePathBestEffort(root);
    Fail("failed to create directory symlink fixture");
  }
  options.dest_dir = alias / "archives";
  options.excluded_files = {alias / "archive_history.log"};
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles with aliased destination failed: " + error);
  }
  if (RelativePaths(candidates) != expected_all) {
    RemovePathBestEffort(root);
    Fail("destination reached through a symlink must still be excluded");
  }

  // Selecting through the alias yields the same relative members.
  options.source_dir = alias;
  options.dest_dir = dest;
  options.excluded_files = {source / "archive_history.log"};
  if (!logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("SelectCandidateFiles through aliased source failed: " + error);
  }
  if (RelativePaths(candidates) != expected_all) {
    RemovePathBestEffort(root);
    Fail("aliased source must select the same files");
  }

  options.source_dir = root / "missing";
  if (logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("missing source directory must fail selection");
  }
  logarchive::tests::common::AssertContains(error, "source directory not found");

  options.source_dir = root / "outside.log";
  if (logarchive::archive::SelectCandidateFiles(options, candidates, error)) {
    RemovePathBestEffort(root);
    Fail("file source path must fail selection");
  }
  logarchive::tests::common::AssertContains(error, "not a directory");

  RemovePathBestEffort(root);
  return 0;
}
