#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camfeed::capture {

// Environment variable naming a CSV device fixture
// (`device_id,friendly_name[,bus_info[,capture_index]]`).
inline constexpr const char* kDeviceFixtureEnvVar = "CAMFEED_DEVICE_FIXTURE";

// Minimal normalized identity of one input device.
struct InputDeviceInfo {
  std::string device_id;
  std::string friendly_name;
  std::optional<std::string> bus_info;
  std::optional<std::size_t> capture_index;
};

// Capability-gated device enumeration used when a `Capturer` is created.
//
// Semantics:
// - `Available() == false` means the host offers no trustworthy listing, so
//   index validation is skipped and deferred to probing
// - `ListInputDevices` returns `true` on a successful scan (including zero
//   devices) and `false` only for hard scan/setup errors
class IDeviceLister {
public:
  virtual ~IDeviceLister() = default;

  virtual bool Available() const = 0;
  virtual bool ListInputDevices(std::vector<InputDeviceInfo>& devices, std::string& error) = 0;
};

class UnavailableDeviceLister final : public IDeviceLister {
public:
  bool Available() const override;
  bool ListInputDevices(std::vector<InputDeviceInfo>& devices, std::string& error) override;
};

// Reads devices from a CSV fixture file. Blank lines, `#` comments and a
// `device_id,friendly_name` header row are skipped.
class FixtureDeviceLister final : public IDeviceLister {
public:
  explicit FixtureDeviceLister(std::string fixture_path);

  bool Available() const override;
  bool ListInputDevices(std::vector<InputDeviceInfo>& devices, std::string& error) override;

  const std::string& fixture_path() const;

private:
  std::string fixture_path_;
};

// Fixture lister when `CAMFEED_DEVICE_FIXTURE` is set, else unavailable.
std::unique_ptr<IDeviceLister> CreateDefaultDeviceLister();

// OS-native lister (V4L2 on Linux); unavailable on other hosts.
std::unique_ptr<IDeviceLister> CreateNativeDeviceLister();

} // namespace camfeed::capture
