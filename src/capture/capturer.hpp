#pragma once

#include "capture/capture_handle.hpp"
#include "capture/device_lister.hpp"
#include "capture/probe_plan.hpp"
#include "core/logging/logger.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

namespace camfeed::capture {

constexpr int kDefaultWidth = 960;
constexpr int kDefaultHeight = 540;
constexpr double kDefaultFps = 60.0;

// Requested stream shape. Advisory: devices may silently ignore values they
// cannot honor. Width and height must still be positive, because they size
// the black frames used after degradation.
//
// `preferred_api` forces `(device index, api)` to the front of the candidate
// list; the platform's usual candidates follow it.
struct CaptureSettings {
  int width = kDefaultWidth;
  int height = kDefaultHeight;
  double fps = kDefaultFps;
  std::optional<CaptureApi> preferred_api;
};

using FrameCallback = std::function<void(const cv::Mat& frame)>;
using CaptureConfig = std::map<std::string, std::string>;

enum class ProbeOutcome {
  kOpened = 0,
  kNotOpened,
  kThrew,
};

const char* ToString(ProbeOutcome outcome);

// One entry per candidate tried during the most recent `Start`.
struct ProbeAttempt {
  ProbeCandidate candidate;
  ProbeOutcome outcome = ProbeOutcome::kNotOpened;
  std::string detail;
};

// Collaborators injected at creation. Null members fall back to the
// environment-driven device lister, the OpenCV handle factory, no logging and
// the build host's platform.
struct CapturerDependencies {
  IDeviceLister* device_lister = nullptr;
  std::unique_ptr<ICaptureHandleFactory> handle_factory;
  core::logging::Logger* logger = nullptr;
  std::optional<HostPlatform> platform;
};

// Owns one capture handle (real device or `DummySource`) and exposes pull
// (`Read`) and push (frame callback) access to its frames.
//
// Lifecycle: Create -> Start -> Read... -> Release. `Start` probes an ordered
// list of `(index, api)` candidates and degrades to black frames when none
// opens, so a started capturer always yields frames.
//
// Not thread-safe: every call is expected from the owning thread. `Read`
// blocks on the device with no timeout and runs the callback inline before
// returning.
class Capturer {
public:
  // Validates `device_index` against the device lister when it is available:
  // it must be one of the listed `capture_index` values when the lister
  // reports any, else a position in the listing. Returns nullptr with an
  // `INVALID_DEVICE:` or `DEVICE_LISTING_FAILED:` error on failure.
  static std::unique_ptr<Capturer> Create(int device_index, CapturerDependencies dependencies,
                                          std::string& error);
  static std::unique_ptr<Capturer> Create(int device_index, std::string& error);

  ~Capturer();

  Capturer(const Capturer&) = delete;
  Capturer& operator=(const Capturer&) = delete;

  // Returns false when already running, when width or height is not
  // positive, or when an unexpected error escapes the open/degrade path;
  // partial handles are released first.
  bool Start(int width = kDefaultWidth, int height = kDefaultHeight, double fps = kDefaultFps);
  bool Start(const CaptureSettings& settings);

  // On success `frame` holds the new frame, which is also kept as the last
  // frame and passed to the callback. On failure `frame` is emptied.
  bool Read(cv::Mat& frame);

  // Idempotent. Capture may be started again afterwards.
  void Release();

  // Last write wins; an empty callback unregisters.
  void SetFrameCallback(FrameCallback callback);

  bool IsRunning() const;
  bool IsDegraded() const;
  int DeviceIndex() const;
  HostPlatform Platform() const;
  const CaptureSettings& Settings() const;
  std::optional<ProbeCandidate> SelectedCandidate() const;
  const std::vector<ProbeAttempt>& ProbeAttempts() const;
  std::uint64_t FramesRead() const;
  const cv::Mat& LastFrame() const;

  // Requested settings, probe evidence and stream state as flat key/values.
  // `selected.backend` is the serving backend's own name (`dummy` when
  // degraded, `none` before a successful `Start`).
  CaptureConfig DumpConfig() const;

private:
  Capturer(int device_index, std::unique_ptr<ICaptureHandleFactory> handle_factory,
           core::logging::Logger* logger, HostPlatform platform);

  std::unique_ptr<ICaptureHandle> OpenFirstCandidate(const std::vector<ProbeCandidate>& plan);
  void RecordThrownCandidate(const ProbeCandidate& candidate,
                             std::unique_ptr<ICaptureHandle>& opened, const std::string& reason);
  void ApplySettings(ICaptureHandle& handle);
  void AbandonStart(std::unique_ptr<ICaptureHandle>& handle, const std::string& reason);

  int device_index_ = 0;
  HostPlatform platform_ = HostPlatform::kOther;
  std::unique_ptr<ICaptureHandleFactory> handle_factory_;
  core::logging::Logger* logger_ = nullptr;

  CaptureSettings settings_;
  std::unique_ptr<ICaptureHandle> handle_;
  bool running_ = false;
  bool degraded_ = false;
  std::optional<ProbeCandidate> selected_;
  std::string selected_backend_;
  std::vector<ProbeAttempt> attempts_;
  std::map<std::string, bool> applied_properties_;

  FrameCallback frame_callback_;
  cv::Mat last_frame_;
  std::uint64_t frames_read_ = 0;
};

} // namespace camfeed::capture
