#include "logarchive/archive_run.hpp"

#include "archive/archive_name.hpp"
#include "archive/archive_pruner.hpp"
#include "archive/archive_writer.hpp"
#include "archive/file_selector.hpp"
#include "archive/history_log.hpp"
#include "archive/output_dir_utils.hpp"
#include "archive/run_lock.hpp"
#include "archive/source_cleaner.hpp"
#include "core/errors/exit_codes.hpp"

#include <chrono>
#include <ostream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace logarchive {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitSourceInvalid = core::errors::ToInt(core::errors::ExitCode::kSourceInvalid);
constexpr int kExitArchiveFailed = core::errors::ToInt(core::errors::ExitCode::kArchiveFailed);
constexpr int kExitDeleteFailed = core::errors::ToInt(core::errors::ExitCode::kDeleteFailed);

constexpr std::string_view kDefaultDestDirName = "archives";
constexpr std::string_view kDefaultHistoryLogName = "archive_history.log";

bool ValidateSourceDir(const fs::path& source_dir, std::string& error) {
  if (source_dir.empty()) {
    error = "source directory cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(source_dir, ec) || ec) {
    error = "source directory not found: " + source_dir.string();
    return false;
  }
  if (!fs::is_directory(source_dir, ec) || ec) {
    error = "source path is not a directory: " + source_dir.string();
    return false;
  }
  return true;
}

void PrintPlannedActions(const std::vector<std::string>& planned_actions, std::ostream& out) {
  for (const auto& action : planned_actions) {
    out << "dry-run: " << action << '\n';
  }
}

void PrintRemovalFailures(const archive::RemovalReport& report, std::ostream& err) {
  for (const auto& failure : report.failures) {
    err << "  - " << failure << '\n';
  }
}

} // namespace

fs::path ResolveDestDir(const ArchiveOptions& options) {
  if (options.dest_dir.has_value()) {
    return *options.dest_dir;
  }
  return options.source_dir / kDefaultDestDirName;
}

fs::path ResolveHistoryLog(const ArchiveOptions& options) {
  if (options.history_log.has_value()) {
    return *options.history_log;
  }
  return ResolveDestDir(options) / kDefaultHistoryLogName;
}

int ExecuteArchiveRun(const ArchiveOptions& options, core::logging::Logger& logger,
                      std::ostream& out, std::ostream& err, ArchiveRunResult* run_result) {
  ArchiveRunResult local_result;
  ArchiveRunResult& result = run_result != nullptr ? *run_result : local_result;
  result = ArchiveRunResult{};

  logger.SetMinLevel(options.log_level);
  logger.SetScope(options.source_dir.string());

  std::string error;
  if (!ValidateSourceDir(options.source_dir, error)) {
    logger.Error("source validation failed", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitSourceInvalid;
  }

  const auto started_at = std::chrono::system_clock::now();
  const fs::path dest_dir = ResolveDestDir(options);
  const fs::path history_log = ResolveHistoryLog(options);
  logger.Info("archive run started",
              {{"dest", dest_dir.string()},
               {"history_log", history_log.string()},
               {"days", options.min_age_days ? std::to_string(*options.min_age_days) : "-"},
               {"retain", options.retain_days ? std::to_string(*options.retain_days) : "-"},
               {"move", options.move_sources ? "true" : "false"},
               {"dry_run", options.dry_run ? "true" : "false"}});

  if (!archive::EnsureOutputDir(dest_dir, options.dry_run, result.planned_actions, error)) {
    logger.Error("destination setup failed", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitFailure;
  }

  archive::RunLock run_lock(dest_dir / archive::kRunLockFileName);
  if (!options.dry_run && !run_lock.Acquire(error)) {
    logger.Error("run lock unavailable", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitFailure;
  }

  archive::SelectionOptions selection;
  selection.source_dir = options.source_dir;
  selection.dest_dir = dest_dir;
  selection.min_age_days = options.min_age_days;
  selection.excluded_files.push_back(history_log);
  selection.now = started_at;

  std::vector<archive::CandidateFile> candidates;
  if (!archive::SelectCandidateFiles(selection, candidates, error)) {
    logger.Error("file selection failed", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitFailure;
  }
  logger.Info("candidates selected", {{"count", std::to_string(candidates.size())}});
  for (const auto& candidate : candidates) {
    logger.Debug("candidate", {{"path", candidate.relative_path},
                               {"size_bytes", std::to_string(candidate.size_bytes)}});
  }

  if (candidates.empty()) {
    result.nothing_to_archive = true;
    PrintPlannedActions(result.planned_actions, out);
    out << "nothing to archive in " << options.source_dir.string() << '\n';
    return kExitSuccess;
  }

  archive::ArchiveWriteRequest write_request;
  write_request.dest_dir = dest_dir;
  write_request.archive_name = archive::MakeArchiveName(started_at);
  write_request.dry_run = options.dry_run;

  std::error_code exists_ec;
  if (!options.dry_run && fs::exists(dest_dir / write_request.archive_name, exists_ec)) {
    logger.Warn("archive name already taken; it will be replaced",
                {{"archive", write_request.archive_name}});
  }

  archive::ArchiveWriteResult write_result;
  if (!archive::WriteArchive(candidates, write_request, write_result, result.planned_actions,
                             error)) {
    logger.Error("archive write failed", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitArchiveFailed;
  }
  result.archive_path = write_result.archive_path;
  result.file_count = write_result.member_count;
  result.archive_size_bytes = write_result.size_bytes;
  if (!options.dry_run) {
    logger.Info("archive published", {{"archive", write_result.archive_path.string()},
                                      {"files", std::to_string(write_result.member_count)},
                                      {"size_bytes", std::to_string(write_result.size_bytes)}});
  }

  archive::HistoryEntry history_entry;
  history_entry.recorded_at = std::chrono::system_clock::now();
  history_entry.archive_name = write_request.archive_name;
  history_entry.file_count = write_result.member_count;
  history_entry.size_bytes = write_result.size_bytes;
  history_entry.source_dir = options.source_dir;
  if (!archive::AppendHistoryEntry(history_entry, history_log, options.dry_run,
                                   result.planned_actions, error)) {
    logger.Error("history append failed", {{"error", error}});
    err << "error: " << error << '\n';
    return kExitArchiveFailed;
  }

  bool delete_failed = false;
  if (options.move_sources) {
    archive::RemovalReport removal;
    if (!archive::RemoveSourceFiles(candidates, options.dry_run, removal,
                                    result.planned_actions, error)) {
      logger.Error("source removal failed", {{"error", error}});
      err << "error: " << error << '\n';
      PrintRemovalFailures(removal, err);
      delete_failed = true;
    }
    for (const auto& removed : removal.removed) {
      logger.Debug("source removed", {{"path", removed.string()}});
    }
    result.sources_removed = removal.removed.size();
  }

  if (options.retain_days.has_value()) {
    archive::PruneOptions prune;
    prune.dest_dir = dest_dir;
    prune.retention_days = *options.retain_days;
    prune.dry_run = options.dry_run;
    prune.now = std::chrono::system_clock::now();

    archive::RemovalReport pruned;
    if (!archive::PruneExpiredArchives(prune, pruned, result.planned_actions, error)) {
      logger.Error("archive pruning failed", {{"error", error}});
      err << "error: " << error << '\n';
      PrintRemovalFailures(pruned, err);
      delete_failed = true;
    }
    for (const auto& removed : pruned.removed) {
      logger.Info("expired archive deleted", {{"path", removed.string()}});
    }
    result.archives_pruned = pruned.removed.size();
  }

  if (options.dry_run) {
    PrintPlannedActions(result.planned_actions, out);
  } else {
    out << "archive: " << result.archive_path.string() << '\n';
    out << "files: " << result.file_count << '\n';
    out << "size_bytes: " << result.archive_size_bytes << '\n';
    out << "history: " << history_log.string() << '\n';
    if (options.move_sources) {
      out << "sources_removed: " << result.sources_removed << '\n';
    }
    if (options.retain_days.has_value()) {
      out << "archives_pruned: " << result.archives_pruned << '\n';
    }
  }

  return delete_failed ? kExitDeleteFailed : kExitSuccess;
}

} // namespace logarchive
