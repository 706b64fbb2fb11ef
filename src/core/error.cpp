#include <imgpipe/core/error.hpp>

namespace imgpipe::core {

std::string_view to_string(ValidationError e) noexcept {
  switch (e) {
    case ValidationError::BadExtension:
      return "BadExtension";
    case ValidationError::BadMimeType:
      return "BadMimeType";
    case ValidationError::EmptyUpload:
      return "EmptyUpload";
    case ValidationError::OversizedImage:
      return "OversizedImage";
    case ValidationError::SignatureMismatch:
      return "SignatureMismatch";
    case ValidationError::CorruptImage:
      return "CorruptImage";
  }
  return "Unknown";
}

std::string_view to_string(StorageError e) noexcept {
  switch (e) {
    case StorageError::CreateDirectoryFailed:
      return "CreateDirectoryFailed";
    case StorageError::WriteFailed:
      return "WriteFailed";
    case StorageError::RenameFailed:
      return "RenameFailed";
    case StorageError::ReadFailed:
      return "ReadFailed";
    case StorageError::NotFound:
      return "NotFound";
  }
  return "Unknown";
}

std::string_view to_string(EnqueueError e) noexcept {
  switch (e) {
    case EnqueueError::QueueClosed:
      return "QueueClosed";
    case EnqueueError::QueueFull:
      return "QueueFull";
    case EnqueueError::ConnectionFailed:
      return "ConnectionFailed";
    case EnqueueError::UnknownContent:
      return "UnknownContent";
  }
  return "Unknown";
}

std::string_view to_string(JobError e) noexcept {
  switch (e) {
    case JobError::ReadFailed:
      return "ReadFailed";
    case JobError::DecodeFailed:
      return "DecodeFailed";
    case JobError::EncodeFailed:
      return "EncodeFailed";
    case JobError::WriteFailed:
      return "WriteFailed";
    case JobError::ModelFailed:
      return "ModelFailed";
    case JobError::LedgerFailed:
      return "LedgerFailed";
  }
  return "Unknown";
}

std::string_view to_string(LookupError e) noexcept {
  switch (e) {
    case LookupError::NotFound:
      return "NotFound";
    case LookupError::NotReady:
      return "NotReady";
    case LookupError::InvalidSize:
      return "InvalidSize";
  }
  return "Unknown";
}

}  // namespace imgpipe::core
