#pragma once

#include <imgpipe/core/error.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace imgpipe::app {

/// The three post-processing jobs run once per new content hash.
enum class JobKind {
  Thumbnail,
  Exif,
  Caption,
};

[[nodiscard]] std::string_view to_string(JobKind kind) noexcept;

/// Arguments of one job: which stage, against which content.
struct JobRequest {
  JobKind kind{JobKind::Thumbnail};
  std::string content_hash;
  std::string stored_path;
};

/// Opaque receipt returned by enqueue.
struct JobHandle {
  std::string id;
  JobKind kind{JobKind::Thumbnail};
};

/// Executes one job; called on a worker thread.
using JobHandler = std::function<std::expected<void, core::JobError>(const JobRequest&)>;

/// Queue collaborator: fire-and-forget job submission.
/// Implementations must accept enqueue() from several threads at once.
class IJobQueue {
 public:
  virtual ~IJobQueue() = default;

  [[nodiscard]] virtual std::expected<JobHandle, core::EnqueueError> enqueue(JobRequest request) = 0;

  /// Blocks until every job accepted so far has finished.
  virtual void wait_idle() = 0;

  /// Stops accepting jobs, finishes the ones already queued and joins workers.
  virtual void shutdown() = 0;
};

/// Runs handler on request, logging failures and exceptions. Returns true on success.
/// Shared by the queue implementations.
bool execute_job(const JobHandler& handler, const JobRequest& request);

}  // namespace imgpipe::app
