#include "capture/capture_api.hpp"
#include "capture/probe_plan.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

using camfeed::capture::BuildProbePlan;
using camfeed::capture::CaptureApi;
using camfeed::capture::HostPlatform;
using camfeed::capture::kAnyDeviceIndex;
using camfeed::capture::ProbeCandidate;

std::vector<std::string> Render(const std::vector<ProbeCandidate>& plan) {
  std::vector<std::string> rendered;
  for (const ProbeCandidate& candidate : plan) {
    rendered.push_back(camfeed::capture::ToString(candidate));
  }
  return rendered;
}

} // namespace

TEST_CASE("Windows plan prefers DirectShow then falls back to generic indices",
          "[capture][probe_plan]") {
  const auto plan = BuildProbePlan(HostPlatform::kWindows, 2);
  REQUIRE(Render(plan) == std::vector<std::string>{"index:2/api:dshow", "index:2/api:any",
                                                   "index:-1/api:any", "index:0/api:any"});
}

TEST_CASE("macOS plan alternates generic and AVFoundation apis", "[capture][probe_plan]") {
  const auto plan = BuildProbePlan(HostPlatform::kMacos, 1);
  REQUIRE(Render(plan) ==
          std::vector<std::string>{"index:1/api:any", "index:1/api:avfoundation",
                                   "index:0/api:any", "index:0/api:avfoundation"});
}

TEST_CASE("Linux plan prefers V4L2 for the requested index", "[capture][probe_plan]") {
  const auto plan = BuildProbePlan(HostPlatform::kLinux, 4);
  REQUIRE(plan.size() == 4U);
  CHECK(plan.front() == ProbeCandidate{.device_index = 4, .api = CaptureApi::kV4l2});
  CHECK(plan[2] == ProbeCandidate{.device_index = kAnyDeviceIndex, .api = CaptureApi::kAny});
  CHECK(plan.back() == ProbeCandidate{.device_index = 0, .api = CaptureApi::kAny});
}

TEST_CASE("Duplicate candidates are dropped keeping first occurrence", "[capture][probe_plan]") {
  const auto mac_plan = BuildProbePlan(HostPlatform::kMacos, 0);
  REQUIRE(Render(mac_plan) ==
          std::vector<std::string>{"index:0/api:any", "index:0/api:avfoundation"});

  const auto windows_plan = BuildProbePlan(HostPlatform::kWindows, 0);
  REQUIRE(Render(windows_plan) ==
          std::vector<std::string>{"index:0/api:dshow", "index:0/api:any", "index:-1/api:any"});
}

TEST_CASE("Forced api leads the plan and is not repeated", "[capture][probe_plan]") {
  const auto msmf_plan = BuildProbePlan(HostPlatform::kWindows, 1, CaptureApi::kMsmf);
  REQUIRE(Render(msmf_plan) ==
          std::vector<std::string>{"index:1/api:msmf", "index:1/api:dshow", "index:1/api:any",
                                   "index:-1/api:any", "index:0/api:any"});

  const auto v4l2_plan = BuildProbePlan(HostPlatform::kLinux, 0, CaptureApi::kV4l2);
  REQUIRE(Render(v4l2_plan) ==
          std::vector<std::string>{"index:0/api:v4l2", "index:0/api:any", "index:-1/api:any"});
}

TEST_CASE("Capture api names round-trip through the parser", "[capture][capture_api]") {
  CaptureApi api = CaptureApi::kAny;
  std::string error;
  REQUIRE(camfeed::capture::ParseCaptureApi("V4L2", api, error));
  CHECK(api == CaptureApi::kV4l2);
  REQUIRE(camfeed::capture::ParseCaptureApi("dshow", api, error));
  CHECK(api == CaptureApi::kDirectShow);
  REQUIRE(camfeed::capture::ParseCaptureApi(" MSMF ", api, error));
  CHECK(api == CaptureApi::kMsmf);

  REQUIRE_FALSE(camfeed::capture::ParseCaptureApi("gstreamer", api, error));
  CHECK(error.find("gstreamer") != std::string::npos);
}
