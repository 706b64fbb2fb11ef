#pragma once

#include <imgpipe/app/config.hpp>
#include <imgpipe/app/ingest_service.hpp>
#include <imgpipe/app/job_orchestrator.hpp>
#include <imgpipe/app/job_queue.hpp>
#include <imgpipe/app/job_runner.hpp>
#include <imgpipe/ledger/ledger.hpp>
#include <imgpipe/storage/content_store.hpp>
#include <imgpipe/vision/caption_model.hpp>
#include <imgpipe/vision/image_decoder.hpp>
#include <memory>

namespace imgpipe::app {

/// Builds the caption model factory selected by cfg.caption_backend.
/// Throws std::runtime_error if onnx is requested without a model or
/// without ONNX Runtime support in this build.
[[nodiscard]] vision::CaptionModelManager::Factory make_caption_factory(const ServiceConfig& cfg);

/// Builds the job queue selected by cfg.queue_backend.
[[nodiscard]] std::unique_ptr<IJobQueue> make_job_queue(const ServiceConfig& cfg, JobHandler handler);

/// Thumbnail variants from cfg (small / medium edges).
[[nodiscard]] std::vector<vision::ThumbnailVariant> thumbnail_variants(const ServiceConfig& cfg);

/// Owns one fully wired ingestion service: ledger, store, decoder, caption
/// model, job runner, queue, orchestrator and ingest front end.
/// Destruction drains the queue before the runner goes away.
class ImagePipeline {
 public:
  explicit ImagePipeline(const ServiceConfig& cfg);
  /// Same, with a caller-supplied caption model factory (tests, demos).
  ImagePipeline(const ServiceConfig& cfg, vision::CaptionModelManager::Factory caption_factory);
  ~ImagePipeline();

  ImagePipeline(const ImagePipeline&) = delete;
  ImagePipeline& operator=(const ImagePipeline&) = delete;

  [[nodiscard]] IngestService& ingest() noexcept { return *ingest_; }
  [[nodiscard]] ledger::Ledger& ledger() noexcept { return ledger_; }
  [[nodiscard]] storage::ContentStore& store() noexcept { return store_; }
  [[nodiscard]] vision::CaptionModelManager& captions() noexcept { return captions_; }
  [[nodiscard]] IJobQueue& queue() noexcept { return *queue_; }

 private:
  ledger::Ledger ledger_;
  storage::ContentStore store_;
  vision::OpenCvImageDecoder decoder_;
  vision::CaptionModelManager captions_;
  JobRunner runner_;
  std::unique_ptr<IJobQueue> queue_;
  std::unique_ptr<JobOrchestrator> orchestrator_;
  std::unique_ptr<IngestService> ingest_;
};

}  // namespace imgpipe::app
