#pragma once

#include <imgpipe/app/job_queue.hpp>
#include <imgpipe/core/error.hpp>
#include <imgpipe/core/records.hpp>
#include <imgpipe/ledger/ledger.hpp>
#include <imgpipe/storage/content_store.hpp>
#include <imgpipe/vision/caption_model.hpp>
#include <imgpipe/vision/image_decoder.hpp>
#include <imgpipe/vision/thumbnailer.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace imgpipe::app {

struct JobRunnerOptions {
  std::vector<vision::ThumbnailVariant> variants{vision::default_thumbnail_variants()};
  int thumbnail_quality{85};
  /// Images are shrunk to fit this box before captioning.
  std::uint32_t caption_max_edge{1024};
};

/// Executes processing jobs against the store and the ledger.
///
/// Thumbnail: every variant is written to the content store.
/// EXIF: the tag map is serialised and written to the content record.
/// Caption: the caption is written and every pending outcome linked to the
/// hash is settled as success; if any caption step fails those outcomes are
/// settled as failed instead. Thumbnail and EXIF failures touch no outcome.
///
/// Safe to call from several worker threads at once.
class JobRunner {
 public:
  using NowFn = std::function<core::TimePoint()>;

  JobRunner(storage::ContentStore& store,
            ledger::Ledger& ledger,
            const vision::IImageDecoder& decoder,
            vision::CaptionModelManager& captions,
            JobRunnerOptions options = {},
            NowFn now = {});

  [[nodiscard]] std::expected<void, core::JobError> run(const JobRequest& request);

  [[nodiscard]] std::expected<void, core::JobError>
  run_thumbnail(const std::string& content_hash, const std::string& stored_path);

  [[nodiscard]] std::expected<void, core::JobError>
  run_exif(const std::string& content_hash, const std::string& stored_path);

  [[nodiscard]] std::expected<void, core::JobError>
  run_caption(const std::string& content_hash, const std::string& stored_path);

  /// run() bound to this runner, for a job queue.
  [[nodiscard]] JobHandler handler();

 private:
  [[nodiscard]] std::expected<std::vector<std::byte>, core::JobError> read_original(const std::string& path) const;
  [[nodiscard]] std::expected<core::Frame, core::JobError> decode(const std::vector<std::byte>& bytes) const;
  [[nodiscard]] std::expected<std::string, core::JobError> generate_caption(const std::string& stored_path);

  storage::ContentStore& store_;
  ledger::Ledger& ledger_;
  const vision::IImageDecoder& decoder_;
  vision::CaptionModelManager& captions_;
  JobRunnerOptions options_;
  NowFn now_;
};

}  // namespace imgpipe::app
