#pragma once

#include "core/time_utils.hpp"

#include <array>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace fleetcap::core::logging {

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

// Accepts the names in kLogLevelChoices plus "warning", case-insensitively.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  static constexpr std::array<std::pair<std::string_view, LogLevel>, 5> kNames = {{
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  }};

  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kLogLevelChoices) + ")";
    return false;
  }

  std::string lowered;
  lowered.reserve(raw.size());
  for (const char c : raw) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (const auto& [name, value] : kNames) {
    if (lowered == name) {
      level = value;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " +
          std::string(kLogLevelChoices) + ")";
  return false;
}

// Appends `raw` as a double-quoted value. Device names and transport errors
// come off the network, so every control byte is escaped to keep one entry
// on one line.
inline void AppendQuotedLogValue(std::string& out, std::string_view raw) {
  out.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\x%02x", static_cast<unsigned char>(c));
        out += escaped;
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  out.push_back('"');
}

// `ts_utc=... level=... session_id="..." msg="..." key="value"...\n`
inline std::string FormatLogLine(std::chrono::system_clock::time_point ts, LogLevel level,
                                 std::string_view session_id, std::string_view message,
                                 std::initializer_list<LogFieldView> fields) {
  std::string line = "ts_utc=" + core::FormatUtcTimestamp(ts) + " level=" + ToString(level);
  line += " session_id=";
  AppendQuotedLogValue(line, session_id);
  line += " msg=";
  AppendQuotedLogValue(line, message);
  for (const LogFieldView& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendQuotedLogValue(line, field.value);
  }
  line.push_back('\n');
  return line;
}

// Single-line `key="value"` logger shared by every fleet component.
//
// Fan-out tasks log from several worker threads at once, so each line is
// written and flushed under one mutex. Lines from different devices may
// interleave with each other but never inside a line.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  // Stamped on every later line; "-" until a session is armed.
  void SetSessionId(std::string session_id) {
    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = std::move(session_id);
  }

  std::string SessionId() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_id_;
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::string session_id;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
      }
      session_id = session_id_;
    }

    const std::string line =
        FormatLogLine(std::chrono::system_clock::now(), level, session_id, message, fields);

    std::lock_guard<std::mutex> lock(mu_);
    out_ << line;
    out_.flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream& out_;
  std::string session_id_ = "-";
};

} // namespace fleetcap::core::logging
