#pragma once

#include <imgpipe/app/job_queue.hpp>
#include <atomic>
#include <cstddef>
#include <memory>

#ifdef IMGPIPE_HAS_TBB

namespace imgpipe::app {

/// Job queue that hands every job to a TBB task_group; the TBB scheduler
/// owns the worker threads. capacity bounds jobs accepted but not finished.
class TbbJobQueue : public IJobQueue {
 public:
  explicit TbbJobQueue(JobHandler handler, std::size_t capacity = 1024);
  ~TbbJobQueue() override;

  TbbJobQueue(const TbbJobQueue&) = delete;
  TbbJobQueue& operator=(const TbbJobQueue&) = delete;

  [[nodiscard]] std::expected<JobHandle, core::EnqueueError> enqueue(JobRequest request) override;
  void wait_idle() override;
  void shutdown() override;

  [[nodiscard]] std::size_t completed() const noexcept { return completed_.load(); }
  [[nodiscard]] std::size_t failed() const noexcept { return failed_.load(); }

 private:
  struct Impl;

  JobHandler handler_;
  std::size_t capacity_;
  std::unique_ptr<Impl> impl_;
  std::atomic<bool> closed_{false};
  std::atomic<std::size_t> outstanding_{0};
  std::atomic<std::size_t> completed_{0};
  std::atomic<std::size_t> failed_{0};
  std::atomic<std::size_t> next_id_{0};
};

}  // namespace imgpipe::app

#endif  // IMGPIPE_HAS_TBB
