#include "capture/linux/v4l2_device_lister.hpp"

#include "core/text_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace camfeed::capture {

namespace {

struct VideoNode {
  fs::path path;
  std::size_t index = 0;
};

bool DiscoverVideoNodes(const fs::path& root, std::vector<VideoNode>& nodes,
                        std::string& error) {
  nodes.clear();
  const auto fail = [&](const std::error_code& ec) {
    error = "failed to scan " + root.string() + " for V4L2 nodes: " + ec.message();
    nodes.clear();
    return false;
  };

  std::error_code ec;
  fs::directory_iterator it(root, ec);
  if (ec) {
    return fail(ec);
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_character_file(type_ec)) {
      continue;
    }
    const std::optional<std::size_t> index = ParseVideoIndex(it->path().filename().string());
    if (index.has_value()) {
      nodes.push_back({.path = it->path(), .index = index.value()});
    }
  }
  if (ec) {
    return fail(ec);
  }

  std::sort(nodes.begin(), nodes.end(),
            [](const VideoNode& left, const VideoNode& right) { return left.index < right.index; });
  return true;
}

int IoctlRetry(const int fd, const unsigned long request, void* arg) {
  int status = 0;
  do {
    status = ioctl(fd, request, arg);
  } while (status != 0 && errno == EINTR);
  return status;
}

bool QueryNode(const VideoNode& node, InputDeviceInfo& device) {
  const int fd = open(node.path.c_str(), O_RDONLY | O_NONBLOCK);
  if (fd < 0) {
    return false;
  }

  v4l2_capability caps{};
  const int query_status = IoctlRetry(fd, VIDIOC_QUERYCAP, &caps);
  close(fd);
  if (query_status != 0) {
    return false;
  }

  const std::uint32_t effective_caps =
      (caps.device_caps != 0U) ? caps.device_caps : caps.capabilities;
  const bool supports_video_capture = (effective_caps & V4L2_CAP_VIDEO_CAPTURE) != 0U ||
                                      (effective_caps & V4L2_CAP_VIDEO_CAPTURE_MPLANE) != 0U;
  if (!supports_video_capture) {
    return false;
  }

  device = InputDeviceInfo{};
  device.device_id = node.path.filename().string();
  device.capture_index = node.index;
  device.friendly_name = core::Trim(reinterpret_cast<const char*>(caps.card));
  if (device.friendly_name.empty()) {
    device.friendly_name = device.device_id;
  }

  const std::string bus_info = core::Trim(reinterpret_cast<const char*>(caps.bus_info));
  if (!bus_info.empty()) {
    device.bus_info = bus_info;
  }
  return true;
}

} // namespace

std::optional<std::size_t> ParseVideoIndex(std::string_view node_name) {
  constexpr std::string_view kPrefix = "video";
  if (node_name.substr(0, kPrefix.size()) != kPrefix) {
    return std::nullopt;
  }
  return core::ParseIndex(node_name.substr(kPrefix.size()));
}

V4l2DeviceLister::V4l2DeviceLister(fs::path device_root) : device_root_(std::move(device_root)) {}

bool V4l2DeviceLister::Available() const {
  return true;
}

bool V4l2DeviceLister::ListInputDevices(std::vector<InputDeviceInfo>& devices,
                                        std::string& error) {
  devices.clear();
  error.clear();

  std::vector<VideoNode> nodes;
  if (!DiscoverVideoNodes(device_root_, nodes, error)) {
    return false;
  }

  for (const VideoNode& node : nodes) {
    InputDeviceInfo device;
    if (!QueryNode(node, device)) {
      continue;
    }
    devices.push_back(std::move(device));
  }
  return true;
}

} // namespace camfeed::capture
