#pragma once

#include <imgpipe/app/job_queue.hpp>
#include <expected>
#include <string>

namespace imgpipe::app {

/// Handles of the three jobs enqueued for one content hash.
struct EnqueuedJobs {
  JobHandle thumbnail;
  JobHandle exif;
  JobHandle caption;
};

/// Enqueues the fixed job set for newly seen content.
///
/// Call only when the ledger reported was_new = true (or for a manual
/// re-trigger). Jobs are enqueued thumbnail, exif, caption; the first
/// failure is returned as-is and jobs already accepted are not withdrawn.
/// The content record is never touched here, so an enqueue failure leaves
/// it committed and recoverable.
class JobOrchestrator {
 public:
  explicit JobOrchestrator(IJobQueue& queue) : queue_(queue) {}

  [[nodiscard]] std::expected<EnqueuedJobs, core::EnqueueError>
  on_new_content(const std::string& content_hash, const std::string& stored_path);

 private:
  IJobQueue& queue_;
};

}  // namespace imgpipe::app
