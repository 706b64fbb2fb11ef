#include <imgpipe/app/ingest_service.hpp>
#include <imgpipe/core/digest.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace imgpipe::app {

using core::OutcomeStatus;
using core::ProcessingOutcome;
using core::UploadAttempt;

namespace {

constexpr const char* kPixelLimitMessage = "Image dimensions exceed pixel limit";
constexpr const char* kStorageFailureMessage = "Failed to save image";

}  // namespace

std::string_view to_string(UploadStatus s) noexcept {
  return s == UploadStatus::Success ? "success" : "failed";
}

IngestService::IngestService(storage::ContentStore& store,
                             ledger::Ledger& ledger,
                             const vision::IImageDecoder& decoder,
                             JobOrchestrator& orchestrator,
                             IngestOptions options,
                             NowFn now)
    : store_(store),
      ledger_(ledger),
      decoder_(decoder),
      orchestrator_(orchestrator),
      options_(std::move(options)),
      now_(now ? std::move(now) : NowFn([] { return core::Clock::now(); })) {}

UploadResponse IngestService::reject(UploadAttempt attempt, std::string reason) {
  attempt.error = reason;
  ledger_.record_upload_attempt(
      attempt, ProcessingOutcome{attempt.attempt_id, attempt.processed_at, attempt.processed_at,
                                 OutcomeStatus::Failed});
  spdlog::warn("upload_rejected image_id={} name={} reason=\"{}\"", attempt.attempt_id,
               attempt.original_name, reason);

  UploadResponse r;
  r.status = UploadStatus::Failed;
  r.data.image_id = attempt.attempt_id;
  r.data.original_name = attempt.original_name;
  r.data.processed_at = attempt.processed_at;
  r.error = std::move(reason);
  return r;
}

std::expected<UploadResponse, core::StorageError>
IngestService::upload(std::string_view filename, std::string_view content_type, std::vector<std::byte> bytes) {
  UploadAttempt attempt;
  attempt.attempt_id = core::random_id();
  attempt.original_name = filename.empty() ? std::string("upload") : std::string(filename);
  attempt.processed_at = now_();

  auto validated = vision::validate_upload(filename, content_type, std::move(bytes), decoder_, options_.limits);
  if (!validated) {
    return reject(std::move(attempt), std::move(validated.error().message));
  }
  if (!validated->has_dimensions()) {
    return reject(std::move(attempt), kPixelLimitMessage);
  }

  auto stored = store_.store(validated->bytes, attempt.original_name);
  if (!stored) {
    spdlog::error("upload_store_failed image_id={} error={}", attempt.attempt_id,
                  core::to_string(stored.error()));
    reject(std::move(attempt), kStorageFailureMessage);
    return std::unexpected(stored.error());
  }
  attempt.stored_path = *stored;
  attempt.content_hash = validated->content_hash;
  // Nothing references the file until the attempt row is committed.
  storage::StoredFileGuard stored_guard(store_, *stored);

  const core::ContentDescriptor descriptor{validated->width, validated->height, validated->format,
                                           static_cast<std::uint64_t>(validated->bytes.size())};
  const auto inserted =
      ledger_.get_or_create_content_record(validated->content_hash, descriptor, attempt.processed_at);

  // Caption stage already settled for this content: nothing will run for
  // this attempt, so it takes the stored result now.
  const OutcomeStatus settled_as = inserted.record.caption_status;
  const bool already_done = !inserted.was_new && settled_as != OutcomeStatus::Pending;
  ProcessingOutcome outcome{attempt.attempt_id, attempt.processed_at, std::nullopt, OutcomeStatus::Pending};
  if (already_done) {
    outcome.end_time = attempt.processed_at;
    outcome.status = settled_as;
  }
  ledger_.record_upload_attempt(attempt, outcome);
  stored_guard.commit();

  spdlog::info("upload_accepted image_id={} sha256={} new={}", attempt.attempt_id,
               validated->content_hash, inserted.was_new);

  if (inserted.was_new) {
    auto jobs = orchestrator_.on_new_content(validated->content_hash, *attempt.stored_path);
    if (!jobs) {
      spdlog::error("failed_to_enqueue sha256={} error={}", validated->content_hash,
                    core::to_string(jobs.error()));
    }
  } else if (!already_done) {
    // The caption stage may have settled between the insert and the attempt row.
    auto current = ledger_.find_content_record(validated->content_hash);
    if (current && current->caption_status != OutcomeStatus::Pending &&
        ledger_.record_outcome(attempt.attempt_id, current->caption_status, now_())) {
      spdlog::debug("upload_settled_late image_id={} status={}", attempt.attempt_id,
                    core::to_string(current->caption_status));
    }
  }

  auto view = ledger_.find_upload(attempt.attempt_id);
  if (!view) {
    throw ledger::LedgerException("ledger: upload attempt vanished after insert: " + attempt.attempt_id);
  }
  return to_response(*view);
}

UploadResponse IngestService::to_response(const core::UploadView& view) const {
  UploadResponse r;
  r.status = view.attempt.error ? UploadStatus::Failed : UploadStatus::Success;
  r.error = view.attempt.error;
  r.data.image_id = view.attempt.attempt_id;
  r.data.original_name = view.attempt.original_name;
  r.data.processed_at = view.attempt.processed_at;
  r.data.stored_path = view.attempt.stored_path;

  if (view.content) {
    const auto& c = *view.content;
    r.data.metadata = ImageMetadata{c.width, c.height, c.format, c.size_bytes,
                                    c.content_hash, c.first_seen, c.exif_json, c.caption};
  }
  if (r.status == UploadStatus::Success) {
    for (const auto& v : options_.variants) {
      r.data.thumbnails[v.name] =
          options_.base_url + "/api/images/" + view.attempt.attempt_id + "/thumbnails/" + v.name;
    }
  }
  return r;
}

std::optional<UploadResponse> IngestService::get_image(const std::string& image_id) {
  auto view = ledger_.find_upload(image_id);
  if (!view) return std::nullopt;
  return to_response(*view);
}

std::vector<UploadResponse> IngestService::list_images() {
  std::vector<UploadResponse> out;
  for (const auto& view : ledger_.list_uploads()) {
    out.push_back(to_response(view));
  }
  return out;
}

std::expected<std::filesystem::path, core::LookupError>
IngestService::get_thumbnail(const std::string& image_id, std::string_view size) {
  const bool known_size = std::any_of(options_.variants.begin(), options_.variants.end(),
                                      [&](const vision::ThumbnailVariant& v) { return v.name == size; });
  if (!known_size) {
    return std::unexpected(core::LookupError::InvalidSize);
  }

  auto view = ledger_.find_upload(image_id);
  if (!view || view->attempt.error || !view->attempt.content_hash) {
    return std::unexpected(core::LookupError::NotFound);
  }

  auto path = store_.thumbnail_path(*view->attempt.content_hash, size);
  if (!store_.exists(path.string())) {
    return std::unexpected(core::LookupError::NotReady);
  }
  return path;
}

std::expected<EnqueuedJobs, core::EnqueueError> IngestService::retrigger(const std::string& content_hash) {
  auto path = ledger_.find_stored_path(content_hash);
  if (!ledger_.find_content_record(content_hash) || !path) {
    return std::unexpected(core::EnqueueError::UnknownContent);
  }
  const bool reopened = ledger_.reopen_caption(content_hash);
  spdlog::info("retrigger sha256={} reopened={}", content_hash, reopened);
  return orchestrator_.on_new_content(content_hash, *path);
}

}  // namespace imgpipe::app
