#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace logarchive::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

struct LogLevelName {
  std::string_view name;
  LogLevel level;
};

// Accepted spellings for --log-level; the first entry per level is canonical.
inline constexpr std::array<LogLevelName, 5> kLogLevelNames = {{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  constexpr std::string_view kExpected = "debug|info|warn|error";

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kExpected) + ")";
    return false;
  }

  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  const auto it = std::find_if(kLogLevelNames.begin(), kLogLevelNames.end(),
                               [&lowered](const LogLevelName& entry) {
                                 return entry.name == lowered;
                               });
  if (it == kLogLevelNames.end()) {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            std::string(kExpected) + ")";
    return false;
  }

  level = it->level;
  return true;
}

namespace detail {

// Wraps a field value in double quotes, escaping quotes, backslashes and
// control characters that would break one-line-per-record parsing.
inline void AppendQuoted(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
    case '"':
      line.push_back('\\');
      line.push_back(c);
      break;
    case '\n':
      line += "\\n";
      break;
    case '\r':
      line += "\\r";
      break;
    case '\t':
      line += "\\t";
      break;
    default:
      line.push_back(c);
      break;
    }
  }
  line.push_back('"');
}

} // namespace detail

// Key=value diagnostics writer. Every line carries the UTC timestamp, level,
// the run scope (the source directory being archived) and the message, then
// any extra fields in call order. Values are always quoted so paths with
// spaces stay parseable.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetScope(std::string scope) {
    scope_ = std::move(scope);
  }

  const std::string& Scope() const {
    return scope_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " scope=";
    detail::AppendQuoted(line, scope_);
    line += " msg=";
    detail::AppendQuoted(line, message);
    for (const auto& field : fields) {
      line.push_back(' ');
      line += field.key;
      line.push_back('=');
      detail::AppendQuoted(line, field.value);
    }
    line.push_back('\n');

    // One write per record keeps lines intact when stderr is shared.
    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string scope_ = "-";
};

} // namespace logarchive::core::logging
