#include "capture/testing/scripted_handle_factory.hpp"

#include <utility>

namespace camfeed::capture::testing {

ScriptedCaptureHandle::ScriptedCaptureHandle(const bool opened, ScriptedStream stream,
                                             std::shared_ptr<ScriptedHandleStats> stats)
    : opened_(opened), stream_(std::move(stream)), stats_(std::move(stats)) {}

bool ScriptedCaptureHandle::IsOpened() const {
  return opened_;
}

bool ScriptedCaptureHandle::Read(cv::Mat& frame) {
  ++stats_->read_calls;
  if (!opened_) {
    return false;
  }
  if (next_read_ < stream_.read_results.size() && !stream_.read_results[next_read_++]) {
    return false;
  }
  ++frames_emitted_;
  frame = cv::Mat(stream_.height, stream_.width, CV_8UC3,
                  cv::Scalar::all(static_cast<double>(frames_emitted_ % 256U)));
  return true;
}

bool ScriptedCaptureHandle::Set(const CaptureProperty property, const double value) {
  if (stream_.throw_on_set) {
    throw std::runtime_error(std::string("scripted set failure for ") + ToString(property));
  }
  if (!stream_.accept_properties) {
    return false;
  }
  stats_->set_values[property] = value;
  return true;
}

void ScriptedCaptureHandle::Release() {
  ++stats_->release_calls;
  opened_ = false;
}

std::string ScriptedCaptureHandle::BackendName() const {
  return "scripted";
}

ScriptedHandleFactory::ScriptedHandleFactory(ScriptedStream stream)
    : stream_(std::move(stream)), stats_(std::make_shared<ScriptedHandleStats>()) {}

void ScriptedHandleFactory::Script(const ProbeCandidate& candidate,
                                   const ScriptedOpenBehavior behavior) {
  script_.push_back({.candidate = candidate, .behavior = behavior});
}

std::unique_ptr<ICaptureHandle> ScriptedHandleFactory::Open(const ProbeCandidate& candidate) {
  stats_->open_calls.push_back(candidate);

  ScriptedOpenBehavior behavior = ScriptedOpenBehavior::kNotOpened;
  for (const ScriptEntry& entry : script_) {
    if (entry.candidate == candidate) {
      behavior = entry.behavior;
      break;
    }
  }

  switch (behavior) {
  case ScriptedOpenBehavior::kThrow:
    throw std::runtime_error("scripted open failure for " + ToString(candidate));
  case ScriptedOpenBehavior::kThrowForeign:
    throw candidate.device_index;
  case ScriptedOpenBehavior::kReturnNull:
    return nullptr;
  case ScriptedOpenBehavior::kOpen:
    ++stats_->handles_created;
    return std::make_unique<ScriptedCaptureHandle>(true, stream_, stats_);
  case ScriptedOpenBehavior::kNotOpened:
    break;
  }
  ++stats_->handles_created;
  return std::make_unique<ScriptedCaptureHandle>(false, stream_, stats_);
}

std::shared_ptr<ScriptedHandleStats> ScriptedHandleFactory::stats() const {
  return stats_;
}

} // namespace camfeed::capture::testing
