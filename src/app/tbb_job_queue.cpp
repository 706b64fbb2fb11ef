#include <imgpipe/app/tbb_job_queue.hpp>

#ifdef IMGPIPE_HAS_TBB

#include <spdlog/spdlog.h>
#include <tbb/task_group.h>
#include <stdexcept>
#include <string>

namespace imgpipe::app {

struct TbbJobQueue::Impl {
  tbb::task_group group;
};

TbbJobQueue::TbbJobQueue(JobHandler handler, std::size_t capacity)
    : handler_(std::move(handler)), capacity_(capacity), impl_(std::make_unique<Impl>()) {
  if (!handler_) {
    throw std::invalid_argument("TbbJobQueue: handler must not be empty");
  }
  spdlog::debug("job_queue_started backend=tbb capacity={}", capacity_);
}

TbbJobQueue::~TbbJobQueue() {
  shutdown();
}

std::expected<JobHandle, core::EnqueueError> TbbJobQueue::enqueue(JobRequest request) {
  if (closed_.load()) {
    return std::unexpected(core::EnqueueError::QueueClosed);
  }
  if (outstanding_.fetch_add(1) >= capacity_) {
    outstanding_.fetch_sub(1);
    return std::unexpected(core::EnqueueError::QueueFull);
  }

  JobHandle handle{"job-" + std::to_string(next_id_.fetch_add(1) + 1), request.kind};
  impl_->group.run([this, request = std::move(request)] {
    const bool ok = execute_job(handler_, request);
    ++(ok ? completed_ : failed_);
    outstanding_.fetch_sub(1);
  });
  return handle;
}

void TbbJobQueue::wait_idle() {
  impl_->group.wait();
}

void TbbJobQueue::shutdown() {
  closed_.store(true);
  impl_->group.wait();
}

}  // namespace imgpipe::app

#endif  // IMGPIPE_HAS_TBB
