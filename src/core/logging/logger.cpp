#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace camfeed::core::logging {

namespace {

std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

std::string EscapeForQuoted(std::string_view raw) {
  std::string escaped;
  escaped.reserve(raw.size());

  for (const char c : raw) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '"':
      escaped += "\\\"";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(c);
      break;
    }
  }

  return escaped;
}

} // namespace

const char* ToString(const LogLevel level) {
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

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

Logger::Logger(const LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

void Logger::SetMinLevel(const LogLevel level) {
  min_level_ = level;
}

LogLevel Logger::MinLevel() const {
  return min_level_;
}

void Logger::SetComponent(std::string component) {
  component_ = std::move(component);
}

const std::string& Logger::Component() const {
  return component_;
}

bool Logger::ShouldLog(const LogLevel level) const {
  return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(const LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) {
  if (!ShouldLog(level)) {
    return;
  }

  (*out_) << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
          << " level=" << ToString(level) << " component=" << Quote(component_)
          << " msg=" << Quote(message);

  for (const auto& field : fields) {
    (*out_) << ' ' << field.key << '=' << Quote(field.value);
  }

  (*out_) << '\n';
  out_->flush();
}

void Logger::Debug(std::string_view message, std::initializer_list<LogFieldView> fields) {
  Log(LogLevel::kDebug, message, fields);
}

void Logger::Info(std::string_view message, std::initializer_list<LogFieldView> fields) {
  Log(LogLevel::kInfo, message, fields);
}

void Logger::Warn(std::string_view message, std::initializer_list<LogFieldView> fields) {
  Log(LogLevel::kWarn, message, fields);
}

void Logger::Error(std::string_view message, std::initializer_list<LogFieldView> fields) {
  Log(LogLevel::kError, message, fields);
}

std::string Logger::FormatUtcTimestamp(const std::chrono::system_clock::time_point ts) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis_component << 'Z';
  return out.str();
}

std::string Logger::Quote(std::string_view raw) {
  return std::string("\"") + EscapeForQuoted(raw) + "\"";
}

} // namespace camfeed::core::logging
