#include "capture/opencv_capture_handle.hpp"

#include <opencv2/core/version.hpp>

namespace camfeed::capture {

OpenCvCaptureHandle::~OpenCvCaptureHandle() {
  Release();
}

bool OpenCvCaptureHandle::Open(const ProbeCandidate& candidate) {
  capture_.release();
  return capture_.open(candidate.device_index, ToOpenCvApiPreference(candidate.api));
}

bool OpenCvCaptureHandle::IsOpened() const {
  return capture_.isOpened();
}

bool OpenCvCaptureHandle::Read(cv::Mat& frame) {
  if (!capture_.isOpened()) {
    return false;
  }
  if (!capture_.read(frame)) {
    return false;
  }
  return !frame.empty();
}

bool OpenCvCaptureHandle::Set(const CaptureProperty property, const double value) {
  if (!capture_.isOpened()) {
    return false;
  }
  return capture_.set(ToOpenCvPropertyId(property), value);
}

void OpenCvCaptureHandle::Release() {
  if (capture_.isOpened()) {
    capture_.release();
  }
}

std::string OpenCvCaptureHandle::BackendName() const {
  if (!capture_.isOpened()) {
    return "";
  }
  return capture_.getBackendName();
}

std::unique_ptr<ICaptureHandle> OpenCvCaptureHandleFactory::Open(const ProbeCandidate& candidate) {
  auto handle = std::make_unique<OpenCvCaptureHandle>();
  if (!handle->Open(candidate)) {
    return nullptr;
  }
  return handle;
}

std::string OpenCvVersionDetail() {
  return std::string("OpenCV ") + CV_VERSION;
}

} // namespace camfeed::capture
