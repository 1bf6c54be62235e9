#pragma once

namespace camfeed::capture {

// Narrow property surface applied to every capture handle after open.
//
// Keeping this enum tiny avoids leaking OpenCV constants through the rest of
// the capture layer; only the OpenCV handle translates it.
enum class CaptureProperty {
  kFrameWidth = 0,
  kFrameHeight,
  kFps,
};

const char* ToString(CaptureProperty property);

// Maps to the matching `cv::CAP_PROP_*` id.
int ToOpenCvPropertyId(CaptureProperty property);

} // namespace camfeed::capture
