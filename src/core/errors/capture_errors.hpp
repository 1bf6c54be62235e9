#pragma once

#include <string_view>

namespace camfeed::core::errors {

// Stable prefixes carried by capture error strings. Callers and tests match
// on the prefix; the text after it is human-facing detail.
inline constexpr std::string_view kInvalidDevice = "INVALID_DEVICE";
inline constexpr std::string_view kDeviceListingFailed = "DEVICE_LISTING_FAILED";
inline constexpr std::string_view kStartFailed = "START_FAILED";

inline bool HasErrorPrefix(std::string_view error, std::string_view prefix) {
  return error.size() > prefix.size() && error.substr(0, prefix.size()) == prefix &&
         error[prefix.size()] == ':';
}

} // namespace camfeed::core::errors
