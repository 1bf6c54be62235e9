#include "capture/capture_api.hpp"

#include "core/text_utils.hpp"

#include <opencv2/videoio.hpp>

namespace camfeed::capture {

const char* ToString(const CaptureApi api) {
  switch (api) {
  case CaptureApi::kAny:
    return "any";
  case CaptureApi::kDirectShow:
    return "dshow";
  case CaptureApi::kMsmf:
    return "msmf";
  case CaptureApi::kAvFoundation:
    return "avfoundation";
  case CaptureApi::kV4l2:
    return "v4l2";
  }
  return "any";
}

bool ParseCaptureApi(std::string_view text, CaptureApi& api, std::string& error) {
  error.clear();
  const std::string normalized = core::ToLowerAscii(core::TrimView(text));

  for (const CaptureApi candidate : {CaptureApi::kAny, CaptureApi::kDirectShow, CaptureApi::kMsmf,
                                     CaptureApi::kAvFoundation, CaptureApi::kV4l2}) {
    if (normalized == ToString(candidate)) {
      api = candidate;
      return true;
    }
  }

  error = "unknown capture api '" + std::string(text) +
          "' (expected any|dshow|msmf|avfoundation|v4l2)";
  return false;
}

int ToOpenCvApiPreference(const CaptureApi api) {
  switch (api) {
  case CaptureApi::kAny:
    return cv::CAP_ANY;
  case CaptureApi::kDirectShow:
    return cv::CAP_DSHOW;
  case CaptureApi::kMsmf:
    return cv::CAP_MSMF;
  case CaptureApi::kAvFoundation:
    return cv::CAP_AVFOUNDATION;
  case CaptureApi::kV4l2:
    return cv::CAP_V4L2;
  }
  return cv::CAP_ANY;
}

} // namespace camfeed::capture
