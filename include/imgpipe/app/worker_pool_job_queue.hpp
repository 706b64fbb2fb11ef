#pragma once

#include <imgpipe/app/job_queue.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace imgpipe::app {

/// In-process job queue backed by a fixed pool of std::thread workers.
/// Jobs run in FIFO order across workers; no ordering between jobs is promised.
class WorkerPoolJobQueue : public IJobQueue {
 public:
  /// num_workers 0 = use hardware concurrency. capacity bounds queued (not running) jobs.
  explicit WorkerPoolJobQueue(JobHandler handler,
                              std::size_t num_workers = 0,
                              std::size_t capacity = 1024);
  ~WorkerPoolJobQueue() override;

  WorkerPoolJobQueue(const WorkerPoolJobQueue&) = delete;
  WorkerPoolJobQueue& operator=(const WorkerPoolJobQueue&) = delete;

  [[nodiscard]] std::expected<JobHandle, core::EnqueueError> enqueue(JobRequest request) override;
  void wait_idle() override;
  void shutdown() override;

  [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }
  [[nodiscard]] std::size_t completed() const;
  [[nodiscard]] std::size_t failed() const;

 private:
  void worker_loop();

  JobHandler handler_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<JobRequest> queue_;
  std::size_t active_{0};
  std::size_t completed_{0};
  std::size_t failed_{0};
  std::size_t next_id_{0};
  bool closed_{false};

  std::vector<std::thread> workers_;
};

}  // namespace imgpipe::app
