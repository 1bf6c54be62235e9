#include "capture/capturer.hpp"

#include "capture/dummy_source.hpp"
#include "capture/opencv_capture_handle.hpp"
#include "core/errors/capture_errors.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

namespace camfeed::capture {

namespace {

std::string FormatDouble(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

std::string BoolText(const bool value) {
  return value ? "true" : "false";
}

// Listers that know OpenCV indices (V4L2, fixtures with a capture_index
// column) are matched by index value; the others by position.
bool IsListedIndex(const std::vector<InputDeviceInfo>& devices, const int device_index) {
  if (device_index < 0) {
    return false;
  }
  const auto index = static_cast<std::size_t>(device_index);
  const bool has_capture_indices =
      std::any_of(devices.begin(), devices.end(),
                  [](const InputDeviceInfo& device) { return device.capture_index.has_value(); });
  if (!has_capture_indices) {
    return index < devices.size();
  }
  return std::any_of(devices.begin(), devices.end(), [index](const InputDeviceInfo& device) {
    return device.capture_index == index;
  });
}

} // namespace

const char* ToString(const ProbeOutcome outcome) {
  switch (outcome) {
  case ProbeOutcome::kOpened:
    return "opened";
  case ProbeOutcome::kNotOpened:
    return "not_opened";
  case ProbeOutcome::kThrew:
    return "threw";
  }
  return "not_opened";
}

std::unique_ptr<Capturer> Capturer::Create(const int device_index,
                                           CapturerDependencies dependencies,
                                           std::string& error) {
  error.clear();

  std::unique_ptr<IDeviceLister> default_lister;
  IDeviceLister* lister = dependencies.device_lister;
  if (lister == nullptr) {
    default_lister = CreateDefaultDeviceLister();
    lister = default_lister.get();
  }

  if (lister->Available()) {
    std::vector<InputDeviceInfo> devices;
    std::string listing_error;
    if (!lister->ListInputDevices(devices, listing_error)) {
      error = std::string(core::errors::kDeviceListingFailed) + ": " + listing_error;
      return nullptr;
    }
    if (!IsListedIndex(devices, device_index)) {
      error = std::string(core::errors::kInvalidDevice) + ": invalid device index " +
              std::to_string(device_index) + ", available devices: " +
              std::to_string(devices.size());
      return nullptr;
    }
  }

  std::unique_ptr<ICaptureHandleFactory> handle_factory = std::move(dependencies.handle_factory);
  if (handle_factory == nullptr) {
    handle_factory = std::make_unique<OpenCvCaptureHandleFactory>();
  }
  const HostPlatform platform = dependencies.platform.value_or(CurrentHostPlatform());

  return std::unique_ptr<Capturer>(
      new Capturer(device_index, std::move(handle_factory), dependencies.logger, platform));
}

std::unique_ptr<Capturer> Capturer::Create(const int device_index, std::string& error) {
  return Create(device_index, CapturerDependencies{}, error);
}

Capturer::Capturer(const int device_index, std::unique_ptr<ICaptureHandleFactory> handle_factory,
                   core::logging::Logger* logger, const HostPlatform platform)
    : device_index_(device_index), platform_(platform),
      handle_factory_(std::move(handle_factory)), logger_(logger) {}

Capturer::~Capturer() {
  Release();
}

bool Capturer::Start(const int width, const int height, const double fps) {
  return Start(CaptureSettings{.width = width, .height = height, .fps = fps});
}

bool Capturer::Start(const CaptureSettings& settings) {
  if (running_) {
    if (logger_ != nullptr) {
      logger_->Warn("capture already running; release before starting again",
                    {{"device_index", std::to_string(device_index_)}});
    }
    return false;
  }

  if (settings.width <= 0 || settings.height <= 0) {
    if (logger_ != nullptr) {
      logger_->Error("capture frame size must be positive",
                     {{"width", std::to_string(settings.width)},
                      {"height", std::to_string(settings.height)}});
    }
    return false;
  }

  settings_ = settings;
  degraded_ = false;
  selected_.reset();
  selected_backend_.clear();
  attempts_.clear();
  applied_properties_.clear();

  std::unique_ptr<ICaptureHandle> handle;
  try {
    if (logger_ != nullptr) {
      logger_->Info("opening capture device", {{"device_index", std::to_string(device_index_)},
                                               {"platform", ToString(platform_)}});
    }

    handle = OpenFirstCandidate(
        BuildProbePlan(platform_, device_index_, settings_.preferred_api));
    if (handle == nullptr) {
      if (logger_ != nullptr) {
        logger_->Warn("no capture device available; using black dummy frames",
                      {{"width", std::to_string(settings_.width)},
                       {"height", std::to_string(settings_.height)}});
      }
      handle = std::make_unique<DummySource>(settings_.width, settings_.height);
      degraded_ = true;
    }

    selected_backend_ = handle->BackendName();
    ApplySettings(*handle);

    handle_ = std::move(handle);
    running_ = true;
    return true;
  } catch (const std::exception& ex) {
    AbandonStart(handle, ex.what());
    return false;
  } catch (...) {
    AbandonStart(handle, "unknown exception");
    return false;
  }
}

void Capturer::AbandonStart(std::unique_ptr<ICaptureHandle>& handle, const std::string& reason) {
  if (handle != nullptr) {
    handle->Release();
    handle.reset();
  }
  degraded_ = false;
  selected_.reset();
  selected_backend_.clear();
  if (logger_ != nullptr) {
    logger_->Error("failed to start capture", {{"error", reason}});
  }
}

std::unique_ptr<ICaptureHandle>
Capturer::OpenFirstCandidate(const std::vector<ProbeCandidate>& plan) {
  for (const ProbeCandidate& candidate : plan) {
    const std::string candidate_text = ToString(candidate);
    if (logger_ != nullptr) {
      logger_->Debug("probing capture candidate", {{"candidate", candidate_text}});
    }

    std::unique_ptr<ICaptureHandle> opened;
    try {
      opened = handle_factory_->Open(candidate);
      if (opened != nullptr && opened->IsOpened()) {
        const std::string backend = opened->BackendName();
        attempts_.push_back(
            {.candidate = candidate, .outcome = ProbeOutcome::kOpened, .detail = backend});
        selected_ = candidate;
        if (logger_ != nullptr) {
          logger_->Info("opened capture device",
                        {{"candidate", candidate_text}, {"backend", backend}});
        }
        return opened;
      }
    } catch (const std::exception& ex) {
      RecordThrownCandidate(candidate, opened, ex.what());
      continue;
    } catch (...) {
      // Some vendor backends throw plain values; the scan still moves on.
      RecordThrownCandidate(candidate, opened, "unknown exception");
      continue;
    }

    if (opened != nullptr) {
      opened->Release();
    }
    attempts_.push_back({.candidate = candidate, .outcome = ProbeOutcome::kNotOpened});
    if (logger_ != nullptr) {
      logger_->Info("capture candidate did not open", {{"candidate", candidate_text}});
    }
  }
  return nullptr;
}

void Capturer::RecordThrownCandidate(const ProbeCandidate& candidate,
                                     std::unique_ptr<ICaptureHandle>& opened,
                                     const std::string& reason) {
  if (opened != nullptr) {
    opened->Release();
    opened.reset();
  }
  attempts_.push_back({.candidate = candidate, .outcome = ProbeOutcome::kThrew, .detail = reason});
  if (logger_ != nullptr) {
    logger_->Warn("capture candidate failed to open",
                  {{"candidate", ToString(candidate)}, {"error", reason}});
  }
}

void Capturer::ApplySettings(ICaptureHandle& handle) {
  const std::pair<CaptureProperty, double> requests[] = {
      {CaptureProperty::kFrameWidth, static_cast<double>(settings_.width)},
      {CaptureProperty::kFrameHeight, static_cast<double>(settings_.height)},
      {CaptureProperty::kFps, settings_.fps},
  };

  for (const auto& [property, value] : requests) {
    bool applied = false;
    std::string detail;
    try {
      applied = handle.Set(property, value);
    } catch (const std::exception& ex) {
      detail = ex.what();
    } catch (...) {
      detail = "unknown exception";
    }
    applied_properties_[ToString(property)] = applied;
    if (!applied && logger_ != nullptr) {
      logger_->Debug("capture property not applied", {{"property", ToString(property)},
                                                      {"value", FormatDouble(value)},
                                                      {"error", detail}});
    }
  }
}

bool Capturer::Read(cv::Mat& frame) {
  if (!running_ || handle_ == nullptr) {
    frame.release();
    return false;
  }

  // Read into a fresh header so the caller's previous frame and the retained
  // last frame are never overwritten in place.
  cv::Mat captured;
  if (!handle_->Read(captured) || captured.empty()) {
    frame.release();
    return false;
  }

  last_frame_ = captured;
  ++frames_read_;
  frame = captured;
  if (frame_callback_) {
    frame_callback_(frame);
  }
  return true;
}

void Capturer::Release() {
  if (!running_) {
    return;
  }
  if (handle_ != nullptr) {
    handle_->Release();
    handle_.reset();
  }
  running_ = false;
  if (logger_ != nullptr) {
    logger_->Info("released capture device", {{"device_index", std::to_string(device_index_)},
                                              {"frames_read", std::to_string(frames_read_)}});
  }
}

void Capturer::SetFrameCallback(FrameCallback callback) {
  frame_callback_ = std::move(callback);
}

bool Capturer::IsRunning() const {
  return running_;
}

bool Capturer::IsDegraded() const {
  return degraded_;
}

int Capturer::DeviceIndex() const {
  return device_index_;
}

HostPlatform Capturer::Platform() const {
  return platform_;
}

const CaptureSettings& Capturer::Settings() const {
  return settings_;
}

std::optional<ProbeCandidate> Capturer::SelectedCandidate() const {
  return selected_;
}

const std::vector<ProbeAttempt>& Capturer::ProbeAttempts() const {
  return attempts_;
}

std::uint64_t Capturer::FramesRead() const {
  return frames_read_;
}

const cv::Mat& Capturer::LastFrame() const {
  return last_frame_;
}

CaptureConfig Capturer::DumpConfig() const {
  CaptureConfig config;
  config["device.index"] = std::to_string(device_index_);
  config["platform"] = ToString(platform_);
  config["requested.width"] = std::to_string(settings_.width);
  config["requested.height"] = std::to_string(settings_.height);
  config["requested.fps"] = FormatDouble(settings_.fps);
  config["requested.api"] =
      settings_.preferred_api.has_value() ? ToString(settings_.preferred_api.value()) : "auto";
  config["running"] = BoolText(running_);
  config["degraded"] = BoolText(degraded_);
  config["selected.candidate"] = selected_.has_value() ? ToString(selected_.value()) : "none";
  config["selected.backend"] = selected_backend_.empty() ? "none" : selected_backend_;
  config["frames_read"] = std::to_string(frames_read_);

  for (const auto& [property, applied] : applied_properties_) {
    config["applied." + property] = BoolText(applied);
  }

  for (std::size_t i = 0; i < attempts_.size(); ++i) {
    const std::string prefix = "probe." + std::to_string(i) + ".";
    config[prefix + "candidate"] = ToString(attempts_[i].candidate);
    config[prefix + "outcome"] = ToString(attempts_[i].outcome);
    if (!attempts_[i].detail.empty()) {
      config[prefix + "detail"] = attempts_[i].detail;
    }
  }
  return config;
}

} // namespace camfeed::capture
