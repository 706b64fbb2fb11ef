#pragma once

#include <imgpipe/core/records.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace imgpipe::app {

enum class UploadStatus {
  Success,
  Failed,
};

[[nodiscard]] std::string_view to_string(UploadStatus s) noexcept;

/// Content metadata shown for an upload that linked to a content record.
struct ImageMetadata {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;
  std::uint64_t size_bytes{0};
  std::string sha256;
  core::TimePoint first_upload{};
  std::optional<std::string> exif_json;
  std::optional<std::string> caption;
};

struct UploadData {
  std::string image_id;
  std::string original_name;
  core::TimePoint processed_at{};
  std::optional<std::string> stored_path;
  std::optional<ImageMetadata> metadata;
  /// Variant name -> URL. Empty unless status is Success.
  std::map<std::string, std::string> thumbnails;
};

/// Outward shape of one upload attempt: either metadata and thumbnails, or an error.
struct UploadResponse {
  UploadStatus status{UploadStatus::Failed};
  UploadData data;
  std::optional<std::string> error;
};

}  // namespace imgpipe::app
