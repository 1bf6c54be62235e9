#include "capture/probe_plan.hpp"

#include <algorithm>

namespace camfeed::capture {

namespace {

void AppendUnique(std::vector<ProbeCandidate>& plan, const ProbeCandidate candidate) {
  if (std::find(plan.begin(), plan.end(), candidate) != plan.end()) {
    return;
  }
  plan.push_back(candidate);
}

} // namespace

const char* ToString(const HostPlatform platform) {
  switch (platform) {
  case HostPlatform::kWindows:
    return "windows";
  case HostPlatform::kMacos:
    return "macos";
  case HostPlatform::kLinux:
    return "linux";
  case HostPlatform::kOther:
    return "other";
  }
  return "other";
}

HostPlatform CurrentHostPlatform() {
#if defined(_WIN32)
  return HostPlatform::kWindows;
#elif defined(__APPLE__)
  return HostPlatform::kMacos;
#elif defined(__linux__)
  return HostPlatform::kLinux;
#else
  return HostPlatform::kOther;
#endif
}

bool operator==(const ProbeCandidate& left, const ProbeCandidate& right) {
  return left.device_index == right.device_index && left.api == right.api;
}

std::string ToString(const ProbeCandidate& candidate) {
  return "index:" + std::to_string(candidate.device_index) + "/api:" + ToString(candidate.api);
}

std::vector<ProbeCandidate> BuildProbePlan(const HostPlatform platform, const int device_index,
                                           const std::optional<CaptureApi> preferred_api) {
  std::vector<ProbeCandidate> plan;
  if (preferred_api.has_value()) {
    plan.push_back({.device_index = device_index, .api = preferred_api.value()});
  }
  switch (platform) {
  case HostPlatform::kWindows:
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kDirectShow});
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = kAnyDeviceIndex, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = 0, .api = CaptureApi::kAny});
    break;
  case HostPlatform::kMacos:
    // Virtual cameras on macOS often only answer through the default api, so
    // AVFoundation is tried second for each index.
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kAvFoundation});
    AppendUnique(plan, {.device_index = 0, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = 0, .api = CaptureApi::kAvFoundation});
    break;
  case HostPlatform::kLinux:
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kV4l2});
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = kAnyDeviceIndex, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = 0, .api = CaptureApi::kAny});
    break;
  case HostPlatform::kOther:
    AppendUnique(plan, {.device_index = device_index, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = kAnyDeviceIndex, .api = CaptureApi::kAny});
    AppendUnique(plan, {.device_index = 0, .api = CaptureApi::kAny});
    break;
  }
  return plan;
}

} // namespace camfeed::capture
