#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgpipe::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Lifecycle of one upload attempt's processing. Pending -> Success | Failed, once.
enum class OutcomeStatus : std::uint8_t {
  Pending = 0,
  Success = 1,
  Failed = 2,
};

[[nodiscard]] std::string_view to_string(OutcomeStatus s) noexcept;

/// Verified upload produced by validate_upload. width/height of 0 is the
/// "unknown" sentinel returned when the header exceeds the pixel ceiling.
struct ValidatedUpload {
  std::string extension;  // lowercase, with dot (".png")
  std::string mime_type;
  std::vector<std::byte> bytes;
  std::string content_hash;  // lowercase hex SHA-256 of bytes
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;  // "png" | "jpeg"; empty with the zero sentinel

  [[nodiscard]] bool has_dimensions() const noexcept {
    return width > 0 && height > 0;
  }
};

/// Fields supplied by ingestion when a content record is first created.
struct ContentDescriptor {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;
  std::uint64_t size_bytes{0};
};

/// One row per unique content hash; shared by every attempt uploading those bytes.
/// exif_json and caption are written later by the processing jobs.
/// caption_status leaves Pending when the caption stage settles the hash.
struct ContentRecord {
  std::string content_hash;
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;
  std::uint64_t size_bytes{0};
  TimePoint first_seen{};
  std::optional<std::string> exif_json;
  std::optional<std::string> caption;
  OutcomeStatus caption_status{OutcomeStatus::Pending};
};

/// One row per upload call, successful or not.
/// content_hash is empty when the upload was rejected before a hash could be trusted.
struct UploadAttempt {
  std::string attempt_id;
  std::string original_name;
  TimePoint processed_at{};
  std::optional<std::string> stored_path;
  std::optional<std::string> content_hash;
  std::optional<std::string> error;
};

/// Processing timeline of one upload attempt.
struct ProcessingOutcome {
  std::string attempt_id;
  TimePoint start_time{};
  std::optional<TimePoint> end_time;
  OutcomeStatus status{OutcomeStatus::Pending};
};

/// An attempt joined with the content record it links to (if any).
struct UploadView {
  UploadAttempt attempt;
  std::optional<ContentRecord> content;
};

/// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.250Z".
[[nodiscard]] std::string format_timestamp(TimePoint t);

/// Milliseconds since the Unix epoch (ledger storage representation).
[[nodiscard]] std::int64_t to_epoch_ms(TimePoint t) noexcept;
[[nodiscard]] TimePoint from_epoch_ms(std::int64_t ms) noexcept;

}  // namespace imgpipe::core
