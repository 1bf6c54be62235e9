#include "capture/capture_property.hpp"

#include <opencv2/videoio.hpp>

namespace camfeed::capture {

const char* ToString(const CaptureProperty property) {
  switch (property) {
  case CaptureProperty::kFrameWidth:
    return "frame_width";
  case CaptureProperty::kFrameHeight:
    return "frame_height";
  case CaptureProperty::kFps:
    return "fps";
  }
  return "unknown";
}

int ToOpenCvPropertyId(const CaptureProperty property) {
  switch (property) {
  case CaptureProperty::kFrameWidth:
    return cv::CAP_PROP_FRAME_WIDTH;
  case CaptureProperty::kFrameHeight:
    return cv::CAP_PROP_FRAME_HEIGHT;
  case CaptureProperty::kFps:
    return cv::CAP_PROP_FPS;
  }
  return cv::CAP_PROP_FRAME_WIDTH;
}

} // namespace camfeed::capture
