#include "capture/dummy_source.hpp"

#include <algorithm>

namespace camfeed::capture {

DummySource::DummySource(const int width, const int height)
    : width_(std::max(0, width)), height_(std::max(0, height)) {}

bool DummySource::IsOpened() const {
  return open_;
}

bool DummySource::Read(cv::Mat& frame) {
  if (!open_) {
    return false;
  }
  // Fresh allocation per read so callers never alias a previous frame.
  frame = cv::Mat(height_, width_, CV_8UC3, cv::Scalar::all(0));
  return true;
}

bool DummySource::Set(const CaptureProperty /*property*/, const double /*value*/) {
  return true;
}

void DummySource::Release() {
  open_ = false;
}

std::string DummySource::BackendName() const {
  return "dummy";
}

} // namespace camfeed::capture
