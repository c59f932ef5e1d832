#pragma once

#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace flowexec::core::logging {

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

namespace detail {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

// First entry per level is its canonical lowercase name.
inline constexpr LevelName kLevelNames[] = {
    {"debug", LogLevel::kDebug}, {"info", LogLevel::kInfo},   {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
};

} // namespace detail

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

inline constexpr std::string_view kLogLevelChoices = "debug|info|warn|error";

// Case-insensitive. "warning" is accepted as an alias of "warn".
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kLogLevelChoices) + ")";
    return false;
  }

  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  const auto* const match =
      std::find_if(std::begin(detail::kLevelNames), std::end(detail::kLevelNames),
                   [&lowered](const detail::LevelName& entry) { return entry.name == lowered; });
  if (match == std::end(detail::kLevelNames)) {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            std::string(kLogLevelChoices) + ")";
    return false;
  }

  level = match->level;
  return true;
}

// Structured key=value logger. Debug, info and warn lines go to the info
// sink; error lines go to the error sink. Every value is written as a quoted
// JSON string so multi-line stacks stay on one log line.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo,
                  std::ostream& info_out = std::clog,
                  std::ostream& error_out = std::cerr)
      : min_level_(min_level), info_out_(&info_out), error_out_(&error_out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetSinks(std::ostream& info_out, std::ostream& error_out) {
    info_out_ = &info_out;
    error_out_ = &error_out;
  }

  // Stamped on every following line; "-" until an execution id is known.
  void SetRunId(std::string run_id) {
    run_id_ = std::move(run_id);
  }

  const std::string& RunId() const {
    return run_id_;
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

    std::string line = "ts_utc=" + FormatUtcTimestamp(Clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "run_id", run_id_);
    AppendField(line, "msg", message);
    for (const LogFieldView& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    std::ostream& out = level == LogLevel::kError ? *error_out_ : *info_out_;
    out << line;
    out.flush();
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
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line += "=\"";
    json::detail::AppendEscaped(line, value);
    line.push_back('"');
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* info_out_ = &std::clog;
  std::ostream* error_out_ = &std::cerr;
  std::string run_id_ = "-";
};

} // namespace flowexec::core::logging
