#include <imgpipe/app/worker_pool_job_queue.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace imgpipe::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

WorkerPoolJobQueue::WorkerPoolJobQueue(JobHandler handler,
                                       std::size_t num_workers,
                                       std::size_t capacity)
    : handler_(std::move(handler)), capacity_(capacity) {
  if (!handler_) {
    throw std::invalid_argument("WorkerPoolJobQueue: handler must not be empty");
  }
  const std::size_t workers = effective_workers(num_workers);
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  spdlog::debug("job_queue_started backend=pool workers={} capacity={}", workers, capacity_);
}

WorkerPoolJobQueue::~WorkerPoolJobQueue() {
  shutdown();
}

std::expected<JobHandle, core::EnqueueError> WorkerPoolJobQueue::enqueue(JobRequest request) {
  JobHandle handle;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return std::unexpected(core::EnqueueError::QueueClosed);
    }
    if (queue_.size() >= capacity_) {
      return std::unexpected(core::EnqueueError::QueueFull);
    }
    handle.id = "job-" + std::to_string(++next_id_);
    handle.kind = request.kind;
    queue_.push_back(std::move(request));
  }
  work_cv_.notify_one();
  return handle;
}

void WorkerPoolJobQueue::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPoolJobQueue::shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (closed_ && workers_.empty()) return;
    closed_ = true;
  }
  work_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

std::size_t WorkerPoolJobQueue::completed() const {
  std::lock_guard lock(mutex_);
  return completed_;
}

std::size_t WorkerPoolJobQueue::failed() const {
  std::lock_guard lock(mutex_);
  return failed_;
}

void WorkerPoolJobQueue::worker_loop() {
  while (true) {
    JobRequest request;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
      if (queue_.empty()) break;  // closed and drained
      request = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    const bool ok = execute_job(handler_, request);

    {
      std::lock_guard lock(mutex_);
      --active_;
      ++(ok ? completed_ : failed_);
      if (queue_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

}  // namespace imgpipe::app
