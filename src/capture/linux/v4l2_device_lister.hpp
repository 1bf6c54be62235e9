#pragma once

#include "capture/device_lister.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camfeed::capture {

// `video7` -> 7. Any other node name (`video`, `video1a`, `media0`) -> nullopt.
std::optional<std::size_t> ParseVideoIndex(std::string_view node_name);

// Lists Linux capture devices from `<device_root>/video*` using
// `VIDIOC_QUERYCAP`.
//
// Only character nodes advertising single- or multi-planar video capture are
// reported; metadata and output nodes are skipped. Rows are ordered by video
// index and carry it as `capture_index`, which is the index OpenCV's V4L2
// backend opens.
class V4l2DeviceLister final : public IDeviceLister {
public:
  explicit V4l2DeviceLister(std::filesystem::path device_root = "/dev");

  bool Available() const override;
  bool ListInputDevices(std::vector<InputDeviceInfo>& devices, std::string& error) override;

private:
  std::filesystem::path device_root_;
};

} // namespace camfeed::capture
