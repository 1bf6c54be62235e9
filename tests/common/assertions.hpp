#ifndef CAMFEED_TESTS_COMMON_ASSERTIONS_HPP_
#define CAMFEED_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <iostream>
#include <string_view>

#include <opencv2/core.hpp>

namespace camfeed::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

// Asserts `frame` is a `rows x cols` CV_8UC3 image with every byte zero.
inline void AssertBlackFrame(const cv::Mat& frame, int rows, int cols) {
  if (frame.empty()) {
    Fail("expected a black frame but frame is empty");
  }
  if (frame.rows != rows || frame.cols != cols || frame.type() != CV_8UC3) {
    std::cerr << "expected shape: " << rows << 'x' << cols << "x3\n";
    std::cerr << "actual shape: " << frame.rows << 'x' << frame.cols << 'x' << frame.channels()
              << '\n';
    std::abort();
  }
  if (cv::countNonZero(frame.reshape(1)) != 0) {
    Fail("expected every byte of the frame to be zero");
  }
}

} // namespace camfeed::tests::common

#endif // CAMFEED_TESTS_COMMON_ASSERTIONS_HPP_
