#include <imgpipe/vision/image_decoder.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace imgpipe::vision {

std::expected<ImageHeader, DecodeError>
IImageDecoder::decode_dimensions(std::span<const std::byte> data) const {
  auto header = probe_image_header(data);
  if (!header) {
    return std::unexpected(DecodeError::UnrecognisedHeader);
  }
  return *header;
}

std::expected<core::Frame, DecodeError>
OpenCvImageDecoder::decode_full(std::span<const std::byte> data) const {
  auto header = decode_dimensions(data);
  if (!header) {
    return std::unexpected(header.error());
  }

  const cv::Mat encoded(1, static_cast<int>(data.size()), CV_8UC1,
                        const_cast<std::byte*>(data.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(encoded, cv::IMREAD_ANYCOLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(DecodeError::Corrupt);
  }
  if (decoded.empty()) {
    return std::unexpected(DecodeError::Corrupt);
  }
  if (static_cast<std::uint32_t>(decoded.cols) != header->width ||
      static_cast<std::uint32_t>(decoded.rows) != header->height) {
    return std::unexpected(DecodeError::Corrupt);
  }

  core::PixelFormat format = core::PixelFormat::BGR8;
  if (decoded.channels() == 1) format = core::PixelFormat::Grayscale8;
  else if (decoded.channels() == 4) format = core::PixelFormat::BGRA8;

  core::Frame frame = detail::frame_from(decoded, format);
  if (frame.empty()) {
    return std::unexpected(DecodeError::Corrupt);
  }
  return frame;
}

}  // namespace imgpipe::vision
