#pragma once

#include "capture/capture_handle.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace camfeed::capture::testing {

// What `ScriptedHandleFactory::Open` does for one candidate.
enum class ScriptedOpenBehavior {
  kOpen = 0,
  kNotOpened,
  kThrow,
  // Throws a value that does not derive from `std::exception`.
  kThrowForeign,
  kReturnNull,
};

// Counters shared between the factory and every handle it created, so tests
// can observe handles after the capturer has destroyed them.
struct ScriptedHandleStats {
  std::vector<ProbeCandidate> open_calls;
  std::size_t handles_created = 0U;
  std::size_t release_calls = 0U;
  std::size_t read_calls = 0U;
  std::map<CaptureProperty, double> set_values;
};

// Frames from an opened scripted handle are `height x width` CV_8UC3 images
// filled with the 1-based successful-read number (mod 256), so tests can tell
// consecutive frames apart. `read_results` is consumed one entry per read;
// once exhausted every read succeeds.
struct ScriptedStream {
  int width = 64;
  int height = 48;
  std::vector<bool> read_results;
  bool accept_properties = true;
  bool throw_on_set = false;
};

class ScriptedCaptureHandle final : public ICaptureHandle {
public:
  ScriptedCaptureHandle(bool opened, ScriptedStream stream,
                        std::shared_ptr<ScriptedHandleStats> stats);

  bool IsOpened() const override;
  bool Read(cv::Mat& frame) override;
  bool Set(CaptureProperty property, double value) override;
  void Release() override;
  std::string BackendName() const override;

private:
  bool opened_ = false;
  ScriptedStream stream_;
  std::shared_ptr<ScriptedHandleStats> stats_;
  std::size_t next_read_ = 0U;
  std::uint64_t frames_emitted_ = 0U;
};

// Hardware-free `ICaptureHandleFactory`. Candidates without a scripted
// behavior do not open.
class ScriptedHandleFactory final : public ICaptureHandleFactory {
public:
  explicit ScriptedHandleFactory(ScriptedStream stream = {});

  void Script(const ProbeCandidate& candidate, ScriptedOpenBehavior behavior);

  std::unique_ptr<ICaptureHandle> Open(const ProbeCandidate& candidate) override;

  std::shared_ptr<ScriptedHandleStats> stats() const;

private:
  struct ScriptEntry {
    ProbeCandidate candidate;
    ScriptedOpenBehavior behavior = ScriptedOpenBehavior::kNotOpened;
  };

  ScriptedStream stream_;
  std::vector<ScriptEntry> script_;
  std::shared_ptr<ScriptedHandleStats> stats_;
};

} // namespace camfeed::capture::testing
