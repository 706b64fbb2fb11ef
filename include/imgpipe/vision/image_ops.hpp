#pragma once

#include <imgpipe/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

namespace imgpipe::vision {

/// Why a pixel operation could not run.
enum class ImageOpError {
  UnsupportedFormat,
  EncodeFailed,
};

/// Shrinks the frame so that neither edge exceeds max_edge, preserving the
/// aspect ratio (area interpolation). Frames already inside the box are
/// returned unchanged; nothing is ever upscaled.
[[nodiscard]] std::expected<core::Frame, ImageOpError>
fit_within(const core::Frame& input, std::uint32_t max_edge);

/// Converts Grayscale8 / RGB8 / BGR8 / BGRA8 to the requested 3-channel layout (RGB8 or BGR8).
[[nodiscard]] std::expected<core::Frame, ImageOpError>
convert_color(const core::Frame& input, core::PixelFormat output_format);

/// Encodes a Grayscale8 or BGR8 frame as baseline JPEG at the given quality (1-100).
[[nodiscard]] std::expected<std::vector<std::byte>, ImageOpError>
encode_jpeg(const core::Frame& input, int quality);

}  // namespace imgpipe::vision
