#pragma once

#include "capture/capture_handle.hpp"

#include <memory>
#include <string>

#include <opencv2/videoio.hpp>

namespace camfeed::capture {

// `ICaptureHandle` over one `cv::VideoCapture`.
class OpenCvCaptureHandle final : public ICaptureHandle {
public:
  OpenCvCaptureHandle() = default;
  ~OpenCvCaptureHandle() override;

  OpenCvCaptureHandle(const OpenCvCaptureHandle&) = delete;
  OpenCvCaptureHandle& operator=(const OpenCvCaptureHandle&) = delete;

  // Opens `candidate.device_index` with the candidate's api preference.
  // May throw `cv::Exception` from the selected OpenCV backend.
  bool Open(const ProbeCandidate& candidate);

  bool IsOpened() const override;
  bool Read(cv::Mat& frame) override;
  bool Set(CaptureProperty property, double value) override;
  void Release() override;

  // Name OpenCV reports for the backend that actually opened the device,
  // e.g. `V4L2` for a `kAny` candidate.
  std::string BackendName() const override;

private:
  cv::VideoCapture capture_;
};

class OpenCvCaptureHandleFactory final : public ICaptureHandleFactory {
public:
  std::unique_ptr<ICaptureHandle> Open(const ProbeCandidate& candidate) override;
};

// Short build detail for `camfeed version`, e.g. `OpenCV 4.8.0`.
std::string OpenCvVersionDetail();

} // namespace camfeed::capture
