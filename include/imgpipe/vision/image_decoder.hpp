#pragma once

#include <imgpipe/core/frame.hpp>
#include <imgpipe/vision/image_probe.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace imgpipe::vision {

/// Why a decoder could not produce dimensions or pixels.
enum class DecodeError {
  UnrecognisedHeader,
  Corrupt,
};

/// Abstract image decoder: encoded bytes -> dimensions, or -> full Frame.
/// Implement decode_full(); decode_dimensions defaults to the header probe.
class IImageDecoder {
 public:
  virtual ~IImageDecoder() = default;

  /// Header-only read; must not allocate pixel storage.
  [[nodiscard]] virtual std::expected<ImageHeader, DecodeError>
  decode_dimensions(std::span<const std::byte> data) const;

  /// Full decode and structural verification. Must be implemented.
  [[nodiscard]] virtual std::expected<core::Frame, DecodeError>
  decode_full(std::span<const std::byte> data) const = 0;
};

/// OpenCV imdecode-backed decoder. Produces Grayscale8 or BGR8 frames
/// (alpha dropped, 16-bit samples reduced to 8-bit) and rejects images whose
/// decoded size disagrees with the header.
class OpenCvImageDecoder : public IImageDecoder {
 public:
  [[nodiscard]] std::expected<core::Frame, DecodeError>
  decode_full(std::span<const std::byte> data) const override;
};

}  // namespace imgpipe::vision
