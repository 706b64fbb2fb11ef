#pragma once

#include <imgpipe/app/job_orchestrator.hpp>
#include <imgpipe/app/upload_response.hpp>
#include <imgpipe/core/error.hpp>
#include <imgpipe/core/records.hpp>
#include <imgpipe/ledger/ledger.hpp>
#include <imgpipe/storage/content_store.hpp>
#include <imgpipe/vision/image_decoder.hpp>
#include <imgpipe/vision/thumbnailer.hpp>
#include <imgpipe/vision/validator.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgpipe::app {

struct IngestOptions {
  vision::ValidatorLimits limits;
  /// Prefix of thumbnail URLs in responses.
  std::string base_url{"http://localhost:8000"};
  std::vector<vision::ThumbnailVariant> variants{vision::default_thumbnail_variants()};
};

/// Upload ingestion and the read API over its results.
///
/// upload(): validate -> store original -> insert-if-absent content record
/// -> record attempt -> enqueue jobs when the content is new. Every call
/// leaves exactly one upload attempt in the ledger, including rejected ones.
/// Enqueue failures are logged and leave the content record in place.
class IngestService {
 public:
  using NowFn = std::function<core::TimePoint()>;

  IngestService(storage::ContentStore& store,
                ledger::Ledger& ledger,
                const vision::IImageDecoder& decoder,
                JobOrchestrator& orchestrator,
                IngestOptions options = {},
                NowFn now = {});

  /// Returns a Success or Failed response; StorageError only when the
  /// original could not be persisted (the failed attempt is still recorded).
  /// Ledger failures throw ledger::LedgerException.
  [[nodiscard]] std::expected<UploadResponse, core::StorageError>
  upload(std::string_view filename, std::string_view content_type, std::vector<std::byte> bytes);

  [[nodiscard]] std::optional<UploadResponse> get_image(const std::string& image_id);

  /// Every attempt, most recent first.
  [[nodiscard]] std::vector<UploadResponse> list_images();

  /// Path of a generated thumbnail. InvalidSize for an unknown variant,
  /// NotFound for an unknown or failed upload, NotReady until the thumbnail job has run.
  [[nodiscard]] std::expected<std::filesystem::path, core::LookupError>
  get_thumbnail(const std::string& image_id, std::string_view size);

  /// Re-enqueues the jobs of a known content hash.
  [[nodiscard]] std::expected<EnqueuedJobs, core::EnqueueError> retrigger(const std::string& content_hash);

 private:
  [[nodiscard]] UploadResponse to_response(const core::UploadView& view) const;
  UploadResponse reject(core::UploadAttempt attempt, std::string reason);

  storage::ContentStore& store_;
  ledger::Ledger& ledger_;
  const vision::IImageDecoder& decoder_;
  JobOrchestrator& orchestrator_;
  IngestOptions options_;
  NowFn now_;
};

}  // namespace imgpipe::app
