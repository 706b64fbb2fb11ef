#include <imgpipe/vision/image_ops.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace imgpipe::vision {

using imgpipe::core::Frame;
using imgpipe::core::PixelFormat;

std::expected<Frame, ImageOpError> fit_within(const Frame& input, std::uint32_t max_edge) {
  auto mat_in = detail::view_of(input);
  if (!mat_in || max_edge == 0) {
    return std::unexpected(ImageOpError::UnsupportedFormat);
  }

  const std::uint32_t longest = input.longest_edge();
  if (longest <= max_edge) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), input.format(), std::move(buf));
  }

  const double scale = static_cast<double>(max_edge) / static_cast<double>(longest);
  const int w = std::max(1, static_cast<int>(std::lround(input.width() * scale)));
  const int h = std::max(1, static_cast<int>(std::lround(input.height() * scale)));

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out, cv::Size(w, h), 0, 0, cv::INTER_AREA);
  return detail::frame_from(mat_out, input.format());
}

std::expected<Frame, ImageOpError> convert_color(const Frame& input, PixelFormat output_format) {
  if (output_format != PixelFormat::RGB8 && output_format != PixelFormat::BGR8) {
    return std::unexpected(ImageOpError::UnsupportedFormat);
  }
  auto mat_in = detail::view_of(input);
  if (!mat_in) {
    return std::unexpected(ImageOpError::UnsupportedFormat);
  }

  if (input.format() == output_format) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), output_format, std::move(buf));
  }

  const bool to_rgb = output_format == PixelFormat::RGB8;
  int code = -1;
  switch (input.format()) {
    case PixelFormat::Grayscale8:
      code = to_rgb ? cv::COLOR_GRAY2RGB : cv::COLOR_GRAY2BGR;
      break;
    case PixelFormat::RGB8:
      code = cv::COLOR_RGB2BGR;
      break;
    case PixelFormat::BGR8:
      code = cv::COLOR_BGR2RGB;
      break;
    case PixelFormat::BGRA8:
      code = to_rgb ? cv::COLOR_BGRA2RGB : cv::COLOR_BGRA2BGR;
      break;
    default:
      return std::unexpected(ImageOpError::UnsupportedFormat);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::frame_from(mat_out, output_format);
}

std::expected<std::vector<std::byte>, ImageOpError> encode_jpeg(const Frame& input, int quality) {
  if (input.format() != PixelFormat::Grayscale8 && input.format() != PixelFormat::BGR8) {
    return std::unexpected(ImageOpError::UnsupportedFormat);
  }
  auto mat = detail::view_of(input);
  if (!mat) {
    return std::unexpected(ImageOpError::UnsupportedFormat);
  }

  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100),
                                cv::IMWRITE_JPEG_OPTIMIZE, 1};
  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(".jpeg", *mat, encoded, params)) {
      return std::unexpected(ImageOpError::EncodeFailed);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(ImageOpError::EncodeFailed);
  }

  std::vector<std::byte> out(encoded.size());
  std::transform(encoded.begin(), encoded.end(), out.begin(),
                 [](uchar c) { return static_cast<std::byte>(c); });
  return out;
}

}  // namespace imgpipe::vision
