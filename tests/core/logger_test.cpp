#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <string>

using camfeed::core::logging::Logger;
using camfeed::core::logging::LogLevel;

TEST_CASE("Logger writes one key=value line per record", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetComponent("capture");

  logger.Info("opened capture device", {{"candidate", "index:0/api:v4l2"}});

  const std::string line = out.str();
  CHECK(line.rfind("ts_utc=", 0) == 0);
  CHECK(line.find(" level=INFO component=\"capture\" msg=\"opened capture device\"") !=
        std::string::npos);
  CHECK(line.find(" candidate=\"index:0/api:v4l2\"\n") != std::string::npos);
}

TEST_CASE("Logger drops records below the minimum level", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);

  logger.Debug("probe");
  logger.Info("probe");
  CHECK(out.str().empty());

  logger.Warn("degraded");
  logger.Error("failed");
  CHECK(out.str().find("level=WARN") != std::string::npos);
  CHECK(out.str().find("level=ERROR") != std::string::npos);
}

TEST_CASE("Logger escapes quotes and control characters", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.Debug("line1\nline2", {{"error", "bad \"index\"\t"}});

  const std::string line = out.str();
  CHECK(line.find("msg=\"line1\\nline2\"") != std::string::npos);
  CHECK(line.find("error=\"bad \\\"index\\\"\\t\"") != std::string::npos);
}

TEST_CASE("UTC timestamps carry millisecond precision", "[core][logging]") {
  const auto ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'250));
  CHECK(Logger::FormatUtcTimestamp(ts) == "1970-01-01T00:00:01.250Z");
}

TEST_CASE("ParseLogLevel accepts documented names", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(camfeed::core::logging::ParseLogLevel("DEBUG", level, error));
  CHECK(level == LogLevel::kDebug);
  REQUIRE(camfeed::core::logging::ParseLogLevel("warning", level, error));
  CHECK(level == LogLevel::kWarn);

  REQUIRE_FALSE(camfeed::core::logging::ParseLogLevel("verbose", level, error));
  CHECK(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(camfeed::core::logging::ParseLogLevel("", level, error));
}
