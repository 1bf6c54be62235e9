#pragma once

#include "capture/capture_api.hpp"

#include <optional>
#include <string>
#include <vector>

namespace camfeed::capture {

// Device index OpenCV treats as "first available device".
constexpr int kAnyDeviceIndex = -1;

enum class HostPlatform {
  kWindows = 0,
  kMacos,
  kLinux,
  kOther,
};

const char* ToString(HostPlatform platform);

HostPlatform CurrentHostPlatform();

// One `(device index, capture api)` pair tried during `Capturer::Start`.
struct ProbeCandidate {
  int device_index = 0;
  CaptureApi api = CaptureApi::kAny;
};

bool operator==(const ProbeCandidate& left, const ProbeCandidate& right);

// Renders `index:<n>/api:<name>` for logs and config snapshots.
std::string ToString(const ProbeCandidate& candidate);

// Builds the ordered probe list for one host:
// 0) requested index with `preferred_api`, when the caller forces one
// 1) requested index with the platform's preferred native api
// 2) requested index with the generic/auto api
// 3) well-known fallback indices with decreasingly specific apis
//
// Duplicate pairs (e.g. requested index 0 on macOS) are dropped, keeping the
// first occurrence so order is preserved.
std::vector<ProbeCandidate> BuildProbePlan(HostPlatform platform, int device_index,
                                           std::optional<CaptureApi> preferred_api = std::nullopt);

} // namespace camfeed::capture
