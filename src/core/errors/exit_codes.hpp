#pragma once

namespace camfeed::core::errors {

// Process-exit contract for the `camfeed` CLI.
//
// 0/1/2 keep their conventional meanings; the rest classify capture setup
// failures so wrappers can branch without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInvalidDevice = 20,
  kStartFailed = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camfeed::core::errors
