#pragma once

#include <imgpipe/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace imgpipe::vision::detail {

/// cv::Mat header over the frame's pixels (no copy). nullopt unless frame.well_formed().
/// The view must not outlive the frame.
std::optional<cv::Mat> view_of(const core::Frame& frame);

/// Deep copy of an 8-bit interleaved Mat, tagged with format.
core::Frame frame_from(const cv::Mat& mat, core::PixelFormat format);

}  // namespace imgpipe::vision::detail
