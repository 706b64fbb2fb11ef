#pragma once

#include <imgpipe/core/exif_value.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace imgpipe::vision {

/// Locate the raw TIFF block holding EXIF data: a JPEG APP1 "Exif\0\0"
/// segment or a PNG eXIf chunk. Returns an empty span when there is none.
[[nodiscard]] std::span<const std::byte> find_exif_block(std::span<const std::byte> image);

/// Upper bounds on what one EXIF block may expand into. Entries may share a
/// value offset, so a small block can otherwise describe far more values
/// than it holds bytes.
struct ExifDecodeLimits {
  std::uint32_t max_ifds = 8;
  std::uint32_t max_entries_per_ifd = 512;
  /// Numeric arrays longer than this are dropped.
  std::uint32_t max_elements_per_tag = 256;
  /// Scalars, strings and blobs across the whole block.
  std::uint64_t max_total_values = 4096;
  /// String and blob bytes across the whole block.
  std::uint64_t max_total_bytes = 256 * 1024;
};

/// Parse a TIFF-structured EXIF block. IFD0 and the Exif sub-IFD are merged
/// into one map keyed by tag name; the GPS IFD is nested under "GPSInfo".
/// Parsing stops quietly at the first out-of-bounds offset or once a budget
/// in `limits` is spent; whatever was read up to that point is returned.
[[nodiscard]] core::ExifMap parse_exif_tiff(std::span<const std::byte> tiff,
                                            const ExifDecodeLimits& limits = {});

/// find_exif_block + parse_exif_tiff. Images without EXIF yield an empty map.
[[nodiscard]] core::ExifMap extract_exif(std::span<const std::byte> image,
                                         const ExifDecodeLimits& limits = {});

/// Human-readable name for a primary / Exif IFD tag, or nullopt if unknown.
[[nodiscard]] std::optional<std::string> exif_tag_name(std::uint16_t tag);

/// Human-readable name for a GPS IFD tag, or nullopt if unknown.
[[nodiscard]] std::optional<std::string> gps_tag_name(std::uint16_t tag);

}  // namespace imgpipe::vision
