#include "archive/source_cleaner.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace logarchive::archive {

bool RemoveSourceFiles(const std::vector<CandidateFile>& archived, bool dry_run,
                       RemovalReport& report, std::vector<std::string>& planned_actions,
                       std::string& error) {
  report = RemovalReport{};

  for (const auto& candidate : archived) {
    if (dry_run) {
      planned_actions.push_back("would delete " + candidate.path.string());
      continue;
    }

    std::error_code ec;
    const bool removed = fs::remove(candidate.path, ec);
    if (ec) {
      report.failures.push_back(candidate.path.string() + ": " + ec.message());
      continue;
    }
    if (!removed) {
      report.failures.push_back(candidate.path.string() + ": file disappeared before deletion");
      continue;
    }
    report.removed.push_back(candidate.path);
  }

  if (!report.failures.empty()) {
    error = "failed to delete " + std::to_string(report.failures.size()) + " of " +
            std::to_string(archived.size()) + " archived source file(s)";
    return false;
  }
  return true;
}

} // namespace logarchive::archive
