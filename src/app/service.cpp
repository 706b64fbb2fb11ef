#include <imgpipe/app/service.hpp>
#include <imgpipe/app/worker_pool_job_queue.hpp>
#include <imgpipe/vision/mock_caption_model.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#ifdef IMGPIPE_HAS_TBB
#include <imgpipe/app/tbb_job_queue.hpp>
#endif
#ifdef IMGPIPE_HAS_ONNXRUNTIME
#include <imgpipe/vision/onnx_caption_model.hpp>
#endif

namespace imgpipe::app {

vision::CaptionModelManager::Factory make_caption_factory(const ServiceConfig& cfg) {
  if (cfg.caption_backend == CaptionBackendType::Onnx) {
    if (cfg.caption_model_path.empty() || cfg.caption_vocab_path.empty()) {
      throw std::runtime_error(
          "caption_backend=onnx requires caption_model_path and caption_vocab_path to be set in config");
    }
#ifdef IMGPIPE_HAS_ONNXRUNTIME
    return [model = cfg.caption_model_path, vocab = cfg.caption_vocab_path]()
               -> std::unique_ptr<vision::ICaptionModel> {
      spdlog::info("caption_model_loading path={}", model);
      return std::make_unique<vision::OnnxCaptionModel>(model, vocab);
    };
#else
    throw std::runtime_error("caption_backend=onnx requires a build with ONNX Runtime");
#endif
  }
  return []() -> std::unique_ptr<vision::ICaptionModel> {
    return std::make_unique<vision::MockCaptionModel>();
  };
}

std::unique_ptr<IJobQueue> make_job_queue(const ServiceConfig& cfg, JobHandler handler) {
  if (cfg.queue_backend == QueueBackendType::Tbb) {
#ifdef IMGPIPE_HAS_TBB
    return std::make_unique<TbbJobQueue>(std::move(handler), cfg.queue_capacity);
#else
    throw std::runtime_error("queue_backend=tbb requires a build with TBB");
#endif
  }
  return std::make_unique<WorkerPoolJobQueue>(std::move(handler), cfg.worker_count, cfg.queue_capacity);
}

std::vector<vision::ThumbnailVariant> thumbnail_variants(const ServiceConfig& cfg) {
  return {{"small", cfg.thumbnail_small}, {"medium", cfg.thumbnail_medium}};
}

ImagePipeline::ImagePipeline(const ServiceConfig& cfg)
    : ImagePipeline(cfg, make_caption_factory(cfg)) {}

ImagePipeline::ImagePipeline(const ServiceConfig& cfg, vision::CaptionModelManager::Factory caption_factory)
    : ledger_(cfg.db_path),
      store_(cfg.media_dir),
      captions_(std::move(caption_factory)),
      runner_(store_, ledger_, decoder_, captions_,
              JobRunnerOptions{thumbnail_variants(cfg), cfg.thumbnail_quality, cfg.caption_max_edge}) {
  queue_ = make_job_queue(cfg, runner_.handler());
  orchestrator_ = std::make_unique<JobOrchestrator>(*queue_);

  IngestOptions options;
  options.limits = vision::ValidatorLimits{cfg.max_pixels, cfg.max_upload_bytes};
  options.base_url = cfg.base_url;
  options.variants = thumbnail_variants(cfg);
  ingest_ = std::make_unique<IngestService>(store_, ledger_, decoder_, *orchestrator_, std::move(options));
}

ImagePipeline::~ImagePipeline() {
  ingest_.reset();
  orchestrator_.reset();
  if (queue_) {
    queue_->shutdown();
  }
}

}  // namespace imgpipe::app
