#include "camfeed/cli/router.hpp"

#include "capture/capture_api.hpp"
#include "capture/device_lister.hpp"
#include "capture/opencv_capture_handle.hpp"
#include "capture/probe_plan.hpp"
#include "core/errors/capture_errors.hpp"
#include "core/errors/exit_codes.hpp"

#include <charconv>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

namespace camfeed::cli {

namespace {

constexpr std::string_view kVersion = "0.3.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInvalidDevice = core::errors::ToInt(core::errors::ExitCode::kInvalidDevice);
constexpr int kExitStartFailed = core::errors::ToInt(core::errors::ExitCode::kStartFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camfeed capture [--device <n>] [--width <w>] [--height <h>] [--fps <f>] "
         "[--api <name>] [--frames <n>] [--log-level <debug|info|warn|error>]\n"
      << "  camfeed list-devices [--native]\n"
      << "  camfeed probe-plan [--device <n>] [--platform <windows|macos|linux|other>] "
         "[--api <name>]\n"
      << "api names: any, dshow, msmf, avfoundation, v4l2\n"
      << "  camfeed version\n";
}

template <typename T>
bool ParseInteger(std::string_view raw, T& value) {
  if (raw.empty()) {
    return false;
  }
  T parsed{};
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParsePositiveDouble(std::string_view raw, double& value) {
  if (raw.empty()) {
    return false;
  }
  double parsed = 0.0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || !std::isfinite(parsed) || parsed <= 0.0) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseHostPlatform(std::string_view raw, capture::HostPlatform& platform) {
  for (const capture::HostPlatform candidate :
       {capture::HostPlatform::kWindows, capture::HostPlatform::kMacos,
        capture::HostPlatform::kLinux, capture::HostPlatform::kOther}) {
    if (raw == capture::ToString(candidate)) {
      platform = candidate;
      return true;
    }
  }
  return false;
}

bool ParseApiOption(std::string_view raw, std::optional<capture::CaptureApi>& api,
                    std::string& error) {
  capture::CaptureApi parsed = capture::CaptureApi::kAny;
  if (!capture::ParseCaptureApi(raw, parsed, error)) {
    error = "--api: " + error;
    return false;
  }
  api = parsed;
  return true;
}

// Reads the value following `args[i]` and advances `i` past it.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "camfeed " << kVersion << " (" << capture::OpenCvVersionDetail() << ")\n";
  return kExitSuccess;
}

int CommandListDevices(const std::vector<std::string_view>& args) {
  bool native = false;
  for (const std::string_view token : args) {
    if (token == "--native") {
      native = true;
      continue;
    }
    std::cerr << "error: unknown option: " << token << '\n';
    return kExitUsage;
  }

  std::unique_ptr<capture::IDeviceLister> lister =
      native ? capture::CreateNativeDeviceLister() : capture::CreateDefaultDeviceLister();
  if (!lister->Available()) {
    std::cerr << "error: device listing is not available on this host (set "
              << capture::kDeviceFixtureEnvVar << " or pass --native)\n";
    return kExitFailure;
  }

  std::vector<capture::InputDeviceInfo> devices;
  std::string error;
  if (!lister->ListInputDevices(devices, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "devices: " << devices.size() << '\n';
  for (std::size_t i = 0; i < devices.size(); ++i) {
    const capture::InputDeviceInfo& device = devices[i];
    std::cout << "  [" << i << "] id=" << device.device_id << " name=\"" << device.friendly_name
              << '"';
    if (device.bus_info.has_value()) {
      std::cout << " bus=" << device.bus_info.value();
    }
    if (device.capture_index.has_value()) {
      std::cout << " capture_index=" << device.capture_index.value();
    }
    std::cout << '\n';
  }
  return kExitSuccess;
}

int CommandProbePlan(const std::vector<std::string_view>& args) {
  ProbePlanOptions options;
  std::string error;
  if (!ParseProbePlanOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const capture::HostPlatform platform =
      options.platform.value_or(capture::CurrentHostPlatform());
  const std::vector<capture::ProbeCandidate> plan =
      capture::BuildProbePlan(platform, options.device_index, options.api);
  std::cout << "platform: " << capture::ToString(platform) << '\n';
  for (std::size_t i = 0; i < plan.size(); ++i) {
    std::cout << "  " << (i + 1) << ". " << capture::ToString(plan[i]) << '\n';
  }
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetComponent("capture");

  capture::CapturerDependencies dependencies;
  dependencies.logger = &logger;
  std::unique_ptr<capture::Capturer> capturer =
      capture::Capturer::Create(options.device_index, std::move(dependencies), error);
  if (capturer == nullptr) {
    std::cerr << "error: " << error << '\n';
    return core::errors::HasErrorPrefix(error, core::errors::kInvalidDevice) ||
                   core::errors::HasErrorPrefix(error, core::errors::kDeviceListingFailed)
               ? kExitInvalidDevice
               : kExitFailure;
  }

  if (!capturer->Start(options.settings)) {
    std::cerr << "error: " << core::errors::kStartFailed << ": capture could not be started\n";
    return kExitStartFailed;
  }

  std::uint64_t failed_reads = 0;
  cv::Mat frame;
  for (std::uint64_t i = 0; i < options.frame_count; ++i) {
    if (!capturer->Read(frame)) {
      ++failed_reads;
    }
  }

  const std::optional<capture::ProbeCandidate> selected = capturer->SelectedCandidate();
  const cv::Mat& last = capturer->LastFrame();
  std::cout << "device_index: " << capturer->DeviceIndex() << '\n'
            << "selected: " << (selected.has_value() ? capture::ToString(selected.value()) : "none")
            << '\n'
            << "backend: " << capturer->DumpConfig().at("selected.backend") << '\n'
            << "degraded: " << (capturer->IsDegraded() ? "true" : "false") << '\n'
            << "frames_read: " << capturer->FramesRead() << '\n'
            << "failed_reads: " << failed_reads << '\n';
  if (!last.empty()) {
    std::cout << "frame_shape: " << last.rows << 'x' << last.cols << 'x' << last.channels()
              << '\n';
  }

  capturer->Release();
  return failed_reads == options.frame_count && options.frame_count > 0 ? kExitFailure
                                                                        : kExitSuccess;
}

} // namespace

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error) {
  error.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--device") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!ParseInteger(value, options.device_index) || options.device_index < 0) {
        error = "--device must be a non-negative integer";
        return false;
      }
      continue;
    }
    if (token == "--width" || token == "--height") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      int parsed = 0;
      if (!ParseInteger(value, parsed) || parsed <= 0) {
        error = std::string(token) + " must be a positive integer";
        return false;
      }
      (token == "--width" ? options.settings.width : options.settings.height) = parsed;
      continue;
    }
    if (token == "--fps") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!ParsePositiveDouble(value, options.settings.fps)) {
        error = "--fps must be a positive number";
        return false;
      }
      continue;
    }
    if (token == "--api") {
      if (!TakeValue(args, i, value, error) ||
          !ParseApiOption(value, options.settings.preferred_api, error)) {
        return false;
      }
      continue;
    }
    if (token == "--frames") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!ParseInteger(value, options.frame_count)) {
        error = "--frames must be a non-negative integer";
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseProbePlanOptions(const std::vector<std::string_view>& args, ProbePlanOptions& options,
                           std::string& error) {
  error.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--device") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!ParseInteger(value, options.device_index) || options.device_index < 0) {
        error = "--device must be a non-negative integer";
        return false;
      }
      continue;
    }
    if (token == "--platform") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      capture::HostPlatform platform = capture::HostPlatform::kOther;
      if (!ParseHostPlatform(value, platform)) {
        error = "--platform must be one of windows|macos|linux|other";
        return false;
      }
      options.platform = platform;
      continue;
    }
    if (token == "--api") {
      if (!TakeValue(args, i, value, error) || !ParseApiOption(value, options.api, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
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

  if (command == "capture") {
    return CommandCapture(args);
  }
  if (command == "list-devices") {
    return CommandListDevices(args);
  }
  if (command == "probe-plan") {
    return CommandProbePlan(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camfeed::cli
