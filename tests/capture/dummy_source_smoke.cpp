#include "../common/assertions.hpp"
#include "capture/dummy_source.hpp"

#include <iostream>

int main() {
  using camfeed::capture::CaptureProperty;
  using camfeed::capture::DummySource;
  using camfeed::tests::common::AssertBlackFrame;
  using camfeed::tests::common::Fail;

  DummySource source(320, 240);
  if (!source.IsOpened()) {
    Fail("dummy source should start opened");
  }

  cv::Mat first;
  cv::Mat second;
  if (!source.Read(first) || !source.Read(second)) {
    Fail("dummy source read should always succeed while open");
  }
  AssertBlackFrame(first, 240, 320);
  AssertBlackFrame(second, 240, 320);
  if (first.data == second.data) {
    Fail("each dummy read should allocate a new frame");
  }

  // Property writes are accepted but never change the frame shape.
  if (!source.Set(CaptureProperty::kFrameWidth, 1920.0) ||
      !source.Set(CaptureProperty::kFrameHeight, 1080.0) ||
      !source.Set(CaptureProperty::kFps, 120.0)) {
    Fail("dummy source should accept every property write");
  }
  cv::Mat third;
  if (!source.Read(third)) {
    Fail("dummy read after set should succeed");
  }
  AssertBlackFrame(third, 240, 320);

  source.Release();
  if (source.IsOpened()) {
    Fail("dummy source should report closed after release");
  }
  cv::Mat after_release;
  if (source.Read(after_release)) {
    Fail("dummy source read should fail after release");
  }
  source.Release();

  std::cout << "dummy_source_smoke: ok\n";
  return 0;
}
