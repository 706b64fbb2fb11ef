#ifdef IMGPIPE_HAS_TBB

#include <imgpipe/app/tbb_job_queue.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

namespace ia = imgpipe::app;
namespace ic = imgpipe::core;

namespace {

ia::JobRequest request(ia::JobKind kind) {
  return ia::JobRequest{kind, "abc", "/media/originals/x.png"};
}

}  // namespace

TEST(TbbJobQueue, RunsEveryAcceptedJob) {
  std::atomic<int> runs{0};
  ia::TbbJobQueue queue([&](const ia::JobRequest&) -> std::expected<void, ic::JobError> {
    ++runs;
    return {};
  });
  for (int i = 0; i < 40; ++i) {
    ASSERT_TRUE(queue.enqueue(request(ia::JobKind::Thumbnail)).has_value());
  }
  queue.wait_idle();
  EXPECT_EQ(runs.load(), 40);
  EXPECT_EQ(queue.completed(), 40u);
}

TEST(TbbJobQueue, CountsFailures) {
  ia::TbbJobQueue queue([](const ia::JobRequest& r) -> std::expected<void, ic::JobError> {
    if (r.kind == ia::JobKind::Exif) throw std::runtime_error("boom");
    if (r.kind == ia::JobKind::Caption) return std::unexpected(ic::JobError::ModelFailed);
    return {};
  });
  ASSERT_TRUE(queue.enqueue(request(ia::JobKind::Thumbnail)).has_value());
  ASSERT_TRUE(queue.enqueue(request(ia::JobKind::Exif)).has_value());
  ASSERT_TRUE(queue.enqueue(request(ia::JobKind::Caption)).has_value());
  queue.wait_idle();
  EXPECT_EQ(queue.completed(), 1u);
  EXPECT_EQ(queue.failed(), 2u);
}

TEST(TbbJobQueue, ClosedAfterShutdown) {
  ia::TbbJobQueue queue([](const ia::JobRequest&) -> std::expected<void, ic::JobError> { return {}; });
  queue.shutdown();
  auto r = queue.enqueue(request(ia::JobKind::Thumbnail));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::EnqueueError::QueueClosed);
}

TEST(TbbJobQueue, ZeroCapacityRejects) {
  ia::TbbJobQueue queue([](const ia::JobRequest&) -> std::expected<void, ic::JobError> { return {}; }, 0);
  auto r = queue.enqueue(request(ia::JobKind::Thumbnail));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::EnqueueError::QueueFull);
}

#endif  // IMGPIPE_HAS_TBB
