#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace imgpipe::vision {

enum class ImageFormat : std::uint8_t {
  Unknown,
  Png,
  Jpeg,
};

/// Lowercase format name as stored on content records ("png", "jpeg"; "" for Unknown).
[[nodiscard]] std::string_view format_name(ImageFormat format) noexcept;

/// Dimensions read from the container header without touching pixel data.
struct ImageHeader {
  ImageFormat format{ImageFormat::Unknown};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Reads width/height from a PNG IHDR chunk or the first JPEG SOFn segment.
/// Cost is bounded by the header size, so hostile dimension claims are seen
/// before any pixel buffer is allocated. Returns nullopt for truncated or
/// unrecognised headers.
[[nodiscard]] std::optional<ImageHeader> probe_image_header(std::span<const std::byte> data);

}  // namespace imgpipe::vision
