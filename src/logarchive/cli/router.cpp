#include "logarchive/cli/router.hpp"

#include "archive/tar_gz_reader.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace logarchive::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  logarchive <log-dir> [--days <n>] [--dest <dir>] [--move] [--retain <n>] "
         "[--logfile <path>] [--dry-run] [--log-level <debug|info|warn|error>]\n"
      << "  logarchive list <archive.tar.gz>\n"
      << "  logarchive version\n";
}

bool ParseDayCount(std::string_view flag, std::string_view raw, std::uint32_t& value,
                   std::string& error) {
  if (raw.empty()) {
    error = "missing value for " + std::string(flag);
    return false;
  }

  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  // Keep `days * 86400` comfortably inside the clock's range.
  constexpr std::uint64_t kMaxDays = 1'000'000;
  if (parsed > kMaxDays) {
    error = "value for " + std::string(flag) + " is out of range: " + std::string(raw);
    return false;
  }

  value = static_cast<std::uint32_t>(parsed);
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "logarchive 0.1.0\n";
  return kExitSuccess;
}

int CommandList(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: list requires exactly 1 argument: <archive.tar.gz>\n";
    return kExitUsage;
  }

  const fs::path archive_path(args.front());
  std::vector<archive::ArchiveMember> members;
  std::string error;
  if (!archive::ReadTarGzMembers(archive_path, /*include_content=*/false, members, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& member : members) {
    std::cout << member.size_bytes << "  " << member.path << (member.is_directory ? "/" : "")
              << '\n';
  }
  std::cout << "members: " << members.size() << '\n';
  return kExitSuccess;
}

int CommandArchive(const std::vector<std::string_view>& args) {
  ArchiveOptions options;
  std::string error;
  if (!ParseArchiveOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level, std::cerr);
  return ExecuteArchiveRun(options, logger, std::cout, std::cerr, nullptr);
}

} // namespace

bool ParseArchiveOptions(const std::vector<std::string_view>& args, ArchiveOptions& options,
                         std::string& error) {
  bool has_source = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--move") {
      options.move_sources = true;
      continue;
    }
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--days" || token == "--retain") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      std::uint32_t days = 0;
      if (!ParseDayCount(token, value, days, error)) {
        return false;
      }
      if (token == "--days") {
        options.min_age_days = days;
      } else {
        options.retain_days = days;
      }
      continue;
    }
    if (token == "--dest") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--dest cannot be empty";
        return false;
      }
      options.dest_dir = fs::path(value);
      continue;
    }
    if (token == "--logfile") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--logfile cannot be empty";
        return false;
      }
      options.history_log = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (has_source) {
      error = "exactly 1 log directory is accepted";
      return false;
    }
    options.source_dir = fs::path(token);
    has_source = true;
  }

  if (!has_source || options.source_dir.empty()) {
    error = "missing required argument: <log-dir>";
    return false;
  }

  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "list") {
    return CommandList(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  return CommandArchive(std::vector<std::string_view>(argv + 1, argv + argc));
}

} // namespace logarchive::cli
