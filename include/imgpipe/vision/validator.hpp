#pragma once

#include <imgpipe/core/error.hpp>
#include <imgpipe/core/records.hpp>
#include <imgpipe/vision/image_decoder.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgpipe::vision {

/// Ceilings applied during validation.
struct ValidatorLimits {
  /// Decompression-bomb guard: width * height above this yields the zero-dimension sentinel.
  std::uint64_t max_pixels{50'000'000};
  /// Payloads larger than this are rejected with OversizedImage.
  std::uint64_t max_upload_bytes{100ull * 1024 * 1024};
};

/// Lowercase extension of the last path component, including the dot; "" if none.
[[nodiscard]] std::string lowercase_extension(std::string_view filename);

/// Declared content type, lowercased, parameters (";...") and whitespace stripped.
[[nodiscard]] std::string normalize_mime_type(std::string_view content_type);

/// True if data starts with the magic bytes expected for mime_type.
[[nodiscard]] bool matches_signature(std::string_view mime_type, std::span<const std::byte> data);

/// Validates one upload. Checks run cheapest first and stop at the first failure:
/// extension, declared MIME, non-empty, size ceiling, magic bytes, decoder.
/// When the header declares more than max_pixels pixels the image is not
/// decoded and the result carries width = height = 0 and an empty format.
/// The content hash is computed over the raw bytes. No side effects.
[[nodiscard]] std::expected<core::ValidatedUpload, core::ValidationFailure>
validate_upload(std::string_view filename,
                std::string_view content_type,
                std::vector<std::byte> bytes,
                const IImageDecoder& decoder,
                const ValidatorLimits& limits = {});

}  // namespace imgpipe::vision
