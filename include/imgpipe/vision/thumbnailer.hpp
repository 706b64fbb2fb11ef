#pragma once

#include <imgpipe/core/frame.hpp>
#include <imgpipe/vision/image_ops.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace imgpipe::vision {

/// One thumbnail size: variant name (used in paths and URLs) and bounding box edge.
struct ThumbnailVariant {
  std::string name;
  std::uint32_t max_edge{0};
};

/// "small" (256) and "medium" (768).
[[nodiscard]] std::vector<ThumbnailVariant> default_thumbnail_variants();

/// Decoded image -> 3-channel JPEG that fits max_edge x max_edge.
[[nodiscard]] std::expected<std::vector<std::byte>, ImageOpError>
make_thumbnail(const core::Frame& decoded, std::uint32_t max_edge, int quality);

}  // namespace imgpipe::vision
