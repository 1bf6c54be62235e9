#pragma once

#include "capture/capturer.hpp"
#include "core/logging/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camfeed::cli {

// Options for `camfeed capture`.
struct CaptureOptions {
  int device_index = 0;
  capture::CaptureSettings settings;
  std::uint64_t frame_count = 30;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options for `camfeed probe-plan`.
struct ProbePlanOptions {
  int device_index = 0;
  std::optional<capture::HostPlatform> platform;
  std::optional<capture::CaptureApi> api;
};

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error);
bool ParseProbePlanOptions(const std::vector<std::string_view>& args, ProbePlanOptions& options,
                           std::string& error);

// Routes `camfeed` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => device index rejected or device listing failed
//   21 => capture could not be started
int Dispatch(int argc, char** argv);

} // namespace camfeed::cli
