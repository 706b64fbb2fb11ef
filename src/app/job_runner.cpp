#include <imgpipe/app/job_runner.hpp>
#include <imgpipe/core/exif_value.hpp>
#include <imgpipe/vision/exif_parser.hpp>
#include <imgpipe/vision/image_ops.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <memory>

namespace imgpipe::app {

using core::JobError;

JobRunner::JobRunner(storage::ContentStore& store,
                     ledger::Ledger& ledger,
                     const vision::IImageDecoder& decoder,
                     vision::CaptionModelManager& captions,
                     JobRunnerOptions options,
                     NowFn now)
    : store_(store),
      ledger_(ledger),
      decoder_(decoder),
      captions_(captions),
      options_(std::move(options)),
      now_(now ? std::move(now) : NowFn([] { return core::Clock::now(); })) {}

std::expected<void, JobError> JobRunner::run(const JobRequest& request) {
  try {
    switch (request.kind) {
      case JobKind::Thumbnail: return run_thumbnail(request.content_hash, request.stored_path);
      case JobKind::Exif: return run_exif(request.content_hash, request.stored_path);
      case JobKind::Caption: return run_caption(request.content_hash, request.stored_path);
    }
  } catch (const ledger::LedgerException& e) {
    spdlog::error("job_ledger_error kind={} sha256={} what={}", to_string(request.kind),
                  request.content_hash, e.what());
    return std::unexpected(JobError::LedgerFailed);
  }
  return std::unexpected(JobError::ReadFailed);
}

JobHandler JobRunner::handler() {
  return [this](const JobRequest& request) { return run(request); };
}

std::expected<std::vector<std::byte>, JobError> JobRunner::read_original(const std::string& path) const {
  auto bytes = store_.read(path);
  if (!bytes) {
    spdlog::warn("job_read_failed path={} error={}", path, core::to_string(bytes.error()));
    return std::unexpected(JobError::ReadFailed);
  }
  return std::move(*bytes);
}

std::expected<core::Frame, JobError> JobRunner::decode(const std::vector<std::byte>& bytes) const {
  auto frame = decoder_.decode_full(bytes);
  if (!frame) {
    return std::unexpected(JobError::DecodeFailed);
  }
  return std::move(*frame);
}

std::expected<void, JobError> JobRunner::run_thumbnail(const std::string& content_hash,
                                                       const std::string& stored_path) {
  auto bytes = read_original(stored_path);
  if (!bytes) return std::unexpected(bytes.error());
  auto frame = decode(*bytes);
  if (!frame) return std::unexpected(frame.error());

  for (const auto& variant : options_.variants) {
    auto jpeg = vision::make_thumbnail(*frame, variant.max_edge, options_.thumbnail_quality);
    if (!jpeg) {
      spdlog::warn("thumbnail_encode_failed sha256={} size={}", content_hash, variant.name);
      return std::unexpected(JobError::EncodeFailed);
    }
    auto path = store_.write_thumbnail(content_hash, variant.name, *jpeg);
    if (!path) {
      spdlog::warn("thumbnail_write_failed sha256={} size={} error={}", content_hash, variant.name,
                   core::to_string(path.error()));
      return std::unexpected(JobError::WriteFailed);
    }
    spdlog::info("thumbnail_made sha256={} size={} path={}", content_hash, variant.name, *path);
  }
  return {};
}

std::expected<void, JobError> JobRunner::run_exif(const std::string& content_hash,
                                                  const std::string& stored_path) {
  spdlog::info("exif_job_start sha256={}", content_hash);
  auto bytes = read_original(stored_path);
  if (!bytes) return std::unexpected(bytes.error());

  const core::ExifMap tags = vision::extract_exif(*bytes);
  if (!ledger_.update_content_field(content_hash, ledger::ContentField::ExifJson,
                                    core::exif_to_json(tags))) {
    spdlog::warn("exif_db_update_missed sha256={}", content_hash);
    return std::unexpected(JobError::LedgerFailed);
  }
  spdlog::info("exif_db_updated sha256={} tags={}", content_hash, tags.size());
  return {};
}

std::expected<std::string, JobError> JobRunner::generate_caption(const std::string& stored_path) {
  auto bytes = read_original(stored_path);
  if (!bytes) return std::unexpected(bytes.error());
  auto frame = decode(*bytes);
  if (!frame) return std::unexpected(frame.error());

  auto fitted = vision::fit_within(*frame, options_.caption_max_edge);
  if (!fitted) {
    return std::unexpected(JobError::DecodeFailed);
  }

  std::shared_ptr<vision::ICaptionModel> model;
  try {
    model = captions_.acquire();
  } catch (const std::exception& e) {
    spdlog::error("caption_model_unavailable what={}", e.what());
    return std::unexpected(JobError::ModelFailed);
  }
  try {
    return model->caption(*fitted);
  } catch (const std::exception& e) {
    spdlog::error("caption_inference_threw what={}", e.what());
    return std::unexpected(JobError::ModelFailed);
  }
}

std::expected<void, JobError> JobRunner::run_caption(const std::string& content_hash,
                                                     const std::string& stored_path) {
  auto caption = generate_caption(stored_path);
  if (!caption) {
    const std::size_t settled = ledger_.settle_pending_outcomes(content_hash, core::OutcomeStatus::Failed, now_());
    spdlog::error("caption_job_failed sha256={} error={} outcomes={}", content_hash,
                  core::to_string(caption.error()), settled);
    return std::unexpected(caption.error());
  }

  if (!ledger_.complete_caption(content_hash, *caption, now_())) {
    spdlog::warn("caption_db_update_missed sha256={}", content_hash);
    return std::unexpected(JobError::LedgerFailed);
  }
  spdlog::info("caption_db_updated sha256={} caption=\"{}\"", content_hash, *caption);
  return {};
}

}  // namespace imgpipe::app
