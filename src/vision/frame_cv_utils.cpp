#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstring>
#include <vector>

namespace imgpipe::vision::detail {

std::optional<cv::Mat> view_of(const core::Frame& frame) {
  if (!frame.well_formed()) return std::nullopt;
  return cv::Mat(static_cast<int>(frame.height()), static_cast<int>(frame.width()),
                 CV_8UC(static_cast<int>(frame.channels())),
                 const_cast<std::byte*>(frame.data().data()), frame.row_bytes());
}

core::Frame frame_from(const cv::Mat& mat, core::PixelFormat format) {
  if (mat.empty() || mat.depth() != CV_8U) return core::Frame();

  const auto width = static_cast<std::uint32_t>(mat.cols);
  const auto height = static_cast<std::uint32_t>(mat.rows);
  core::Frame out = core::Frame::blank(width, height, format);
  const std::size_t row = out.row_bytes();
  if (row != static_cast<std::size_t>(mat.cols) * mat.elemSize()) return core::Frame();

  auto* dst = out.data().data();
  for (int y = 0; y < mat.rows; ++y) {
    std::memcpy(dst + static_cast<std::size_t>(y) * row, mat.ptr(y), row);
  }
  return out;
}

}  // namespace imgpipe::vision::detail
