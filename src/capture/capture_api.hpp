#pragma once

#include <string>
#include <string_view>

namespace camfeed::capture {

// Capture subsystem used to reach a device. `kAny` lets OpenCV pick.
enum class CaptureApi {
  kAny = 0,
  kDirectShow,
  kMsmf,
  kAvFoundation,
  kV4l2,
};

const char* ToString(CaptureApi api);

// Accepts the names produced by `ToString` (case-insensitive).
bool ParseCaptureApi(std::string_view text, CaptureApi& api, std::string& error);

// Maps to the matching `cv::CAP_*` api preference.
int ToOpenCvApiPreference(CaptureApi api);

} // namespace camfeed::capture
