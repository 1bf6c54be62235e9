#pragma once

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>

namespace camfeed::core::logging {

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

const char* ToString(LogLevel level);

// Parses `debug|info|warn|warning|error` (case-insensitive) for `--log-level`.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// Line-oriented key=value logger.
//
// Each record is one line:
//   ts_utc=<iso8601> level=<LEVEL> component="<tag>" msg="<text>" k="v" ...
// Values are always quoted and escaped so lines stay grep/parse friendly.
// The logger does not own `out`; it must outlive the logger.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr);

  void SetMinLevel(LogLevel level);
  LogLevel MinLevel() const;

  void SetComponent(std::string component);
  const std::string& Component() const;

  bool ShouldLog(LogLevel level) const;

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {});

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {});
  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {});
  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {});
  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {});

  static std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts);
  static std::string Quote(std::string_view raw);

private:
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string component_ = "-";
};

} // namespace camfeed::core::logging
