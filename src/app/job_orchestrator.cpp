#include <imgpipe/app/job_orchestrator.hpp>
#include <spdlog/spdlog.h>

namespace imgpipe::app {

std::expected<EnqueuedJobs, core::EnqueueError>
JobOrchestrator::on_new_content(const std::string& content_hash, const std::string& stored_path) {
  auto submit = [&](JobKind kind) {
    return queue_.enqueue(JobRequest{kind, content_hash, stored_path});
  };

  auto thumbnail = submit(JobKind::Thumbnail);
  if (!thumbnail) return std::unexpected(thumbnail.error());
  auto exif = submit(JobKind::Exif);
  if (!exif) return std::unexpected(exif.error());
  auto caption = submit(JobKind::Caption);
  if (!caption) return std::unexpected(caption.error());

  spdlog::debug("jobs_enqueued sha256={} thumbnail={} exif={} caption={}", content_hash,
                thumbnail->id, exif->id, caption->id);
  return EnqueuedJobs{std::move(*thumbnail), std::move(*exif), std::move(*caption)};
}

}  // namespace imgpipe::app
