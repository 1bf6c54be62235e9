#pragma once

#include "capture/capture_property.hpp"
#include "capture/probe_plan.hpp"

#include <memory>
#include <string>

#include <opencv2/core/mat.hpp>

namespace camfeed::capture {

// Device-or-synthetic frame source owned by `Capturer`.
//
// Contract:
// - `Read` fills `frame` with one `CV_8UC3` image and returns true, or returns
//   false and leaves `frame` unspecified
// - `Set` is best-effort; callers ignore a false return
// - `Release` is idempotent and makes `IsOpened` false
// - `BackendName` names the subsystem actually serving frames
class ICaptureHandle {
public:
  virtual ~ICaptureHandle() = default;

  virtual bool IsOpened() const = 0;
  virtual bool Read(cv::Mat& frame) = 0;
  virtual bool Set(CaptureProperty property, double value) = 0;
  virtual void Release() = 0;
  virtual std::string BackendName() const = 0;
};

// Opens one probe candidate.
//
// Implementations may throw (OpenCV raises `cv::Exception` from some
// backends) or return a handle whose `IsOpened` is false. Returning nullptr
// is treated like a handle that did not open.
class ICaptureHandleFactory {
public:
  virtual ~ICaptureHandleFactory() = default;
  virtual std::unique_ptr<ICaptureHandle> Open(const ProbeCandidate& candidate) = 0;
};

} // namespace camfeed::capture
