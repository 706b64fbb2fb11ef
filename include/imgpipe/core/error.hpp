#pragma once

#include <string>
#include <string_view>

namespace imgpipe::core {

/// Upload rejection codes; checked cheapest-first by validate_upload.
enum class ValidationError {
  BadExtension,
  BadMimeType,
  EmptyUpload,
  OversizedImage,
  SignatureMismatch,
  CorruptImage,
};

/// Content store failures. Partial files are removed before these are returned.
enum class StorageError {
  CreateDirectoryFailed,
  WriteFailed,
  RenameFailed,
  ReadFailed,
  NotFound,
};

/// Job queue failures; non-fatal to the upload that triggered them.
enum class EnqueueError {
  QueueClosed,
  QueueFull,
  ConnectionFailed,
  UnknownContent,
};

/// Per-stage failure inside a processing job (thumbnail / EXIF / caption).
enum class JobError {
  ReadFailed,
  DecodeFailed,
  EncodeFailed,
  WriteFailed,
  ModelFailed,
  LedgerFailed,
};

/// Read-path lookup failures (image / thumbnail by id).
enum class LookupError {
  NotFound,
  NotReady,
  InvalidSize,
};

/// A rejection plus the reason string persisted on the failed upload attempt.
struct ValidationFailure {
  ValidationError code{ValidationError::CorruptImage};
  std::string message;
};

[[nodiscard]] std::string_view to_string(ValidationError e) noexcept;
[[nodiscard]] std::string_view to_string(StorageError e) noexcept;
[[nodiscard]] std::string_view to_string(EnqueueError e) noexcept;
[[nodiscard]] std::string_view to_string(JobError e) noexcept;
[[nodiscard]] std::string_view to_string(LookupError e) noexcept;

}  // namespace imgpipe::core
