#pragma once

#include "capture/capture_handle.hpp"

namespace camfeed::capture {

// Synthetic source used when no device opens during `Capturer::Start`.
//
// Every read yields a freshly allocated all-zero `height x width x 3` frame,
// so consumers expecting a continuous stream keep running without hardware.
// Property writes are accepted and ignored.
class DummySource final : public ICaptureHandle {
public:
  DummySource(int width, int height);

  bool IsOpened() const override;
  bool Read(cv::Mat& frame) override;
  bool Set(CaptureProperty property, double value) override;
  void Release() override;
  std::string BackendName() const override;

private:
  int width_ = 0;
  int height_ = 0;
  bool open_ = true;
};

} // namespace camfeed::capture
