#include <imgpipe/app/job_queue.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace imgpipe::app {

std::string_view to_string(JobKind kind) noexcept {
  switch (kind) {
    case JobKind::Thumbnail: return "thumbnail";
    case JobKind::Exif: return "exif";
    case JobKind::Caption: return "caption";
  }
  return "unknown";
}

bool execute_job(const JobHandler& handler, const JobRequest& request) {
  try {
    auto result = handler(request);
    if (!result) {
      spdlog::warn("job_failed kind={} sha256={} error={}", to_string(request.kind),
                   request.content_hash, core::to_string(result.error()));
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    spdlog::error("job_crashed kind={} sha256={} what={}", to_string(request.kind),
                  request.content_hash, e.what());
    return false;
  }
}

}  // namespace imgpipe::app
