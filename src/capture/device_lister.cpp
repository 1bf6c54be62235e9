#include "capture/device_lister.hpp"

#if defined(__linux__)
#include "capture/linux/v4l2_device_lister.hpp"
#endif

#include "core/text_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace camfeed::capture {

namespace {

// Column order of a fixture row; only the first two are required.
enum FixtureColumn : std::size_t {
  kDeviceIdColumn = 0,
  kFriendlyNameColumn,
  kBusInfoColumn,
  kCaptureIndexColumn,
};

std::vector<std::string> SplitColumns(std::string_view line) {
  std::vector<std::string> columns;
  std::istringstream stream{std::string(line)};
  std::string column;
  while (std::getline(stream, column, ',')) {
    columns.push_back(core::Trim(column));
  }
  // getline drops an empty trailing column ("a,b,").
  if (!line.empty() && line.back() == ',') {
    columns.emplace_back();
  }
  return columns;
}

bool IsHeaderRow(const std::vector<std::string>& columns) {
  return core::ToLowerAscii(columns[kDeviceIdColumn]) == "device_id" &&
         core::ToLowerAscii(columns[kFriendlyNameColumn]) == "friendly_name";
}

// Parses one non-comment line. `device` stays empty for the header row.
bool ParseFixtureLine(std::string_view line, const std::size_t line_number,
                      std::optional<InputDeviceInfo>& device, std::string& error) {
  device.reset();
  const auto fail = [&](std::string_view reason) {
    error = "device fixture parse error at line " + std::to_string(line_number) + ": " +
            std::string(reason);
    return false;
  };

  std::vector<std::string> columns = SplitColumns(line);
  if (columns.size() <= kFriendlyNameColumn) {
    return fail("expected at least 2 CSV fields (device_id,friendly_name)");
  }
  if (IsHeaderRow(columns)) {
    return true;
  }
  if (columns[kDeviceIdColumn].empty()) {
    return fail("device_id must be non-empty");
  }
  if (columns[kFriendlyNameColumn].empty()) {
    return fail("friendly_name must be non-empty");
  }

  InputDeviceInfo parsed;
  parsed.device_id = std::move(columns[kDeviceIdColumn]);
  parsed.friendly_name = std::move(columns[kFriendlyNameColumn]);
  if (columns.size() > kBusInfoColumn && !columns[kBusInfoColumn].empty()) {
    parsed.bus_info = std::move(columns[kBusInfoColumn]);
  }
  if (columns.size() > kCaptureIndexColumn && !columns[kCaptureIndexColumn].empty()) {
    parsed.capture_index = core::ParseIndex(columns[kCaptureIndexColumn]);
    if (!parsed.capture_index.has_value()) {
      return fail("capture_index must be a non-negative integer");
    }
  }
  device = std::move(parsed);
  return true;
}

} // namespace

bool UnavailableDeviceLister::Available() const {
  return false;
}

bool UnavailableDeviceLister::ListInputDevices(std::vector<InputDeviceInfo>& devices,
                                               std::string& error) {
  devices.clear();
  error = "device listing is not available on this host";
  return false;
}

FixtureDeviceLister::FixtureDeviceLister(std::string fixture_path)
    : fixture_path_(std::move(fixture_path)) {}

bool FixtureDeviceLister::Available() const {
  return true;
}

bool FixtureDeviceLister::ListInputDevices(std::vector<InputDeviceInfo>& devices,
                                           std::string& error) {
  devices.clear();
  error.clear();

  std::ifstream input(fs::path(fixture_path_), std::ios::binary);
  if (!input) {
    error = "unable to open device fixture file: " + fixture_path_;
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string_view content = core::TrimView(line);
    if (content.empty() || content.front() == '#') {
      continue;
    }

    std::optional<InputDeviceInfo> device;
    if (!ParseFixtureLine(content, line_number, device, error)) {
      devices.clear();
      return false;
    }
    if (device.has_value()) {
      devices.push_back(std::move(device.value()));
    }
  }
  return true;
}

const std::string& FixtureDeviceLister::fixture_path() const {
  return fixture_path_;
}

std::unique_ptr<IDeviceLister> CreateDefaultDeviceLister() {
  const char* fixture_path = std::getenv(kDeviceFixtureEnvVar);
  if (fixture_path != nullptr && *fixture_path != '\0') {
    return std::make_unique<FixtureDeviceLister>(fixture_path);
  }
  return std::make_unique<UnavailableDeviceLister>();
}

std::unique_ptr<IDeviceLister> CreateNativeDeviceLister() {
#if defined(__linux__)
  return std::make_unique<V4l2DeviceLister>();
#else
  return std::make_unique<UnavailableDeviceLister>();
#endif
}

} // namespace camfeed::capture
