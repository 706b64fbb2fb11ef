#include <imgpipe/app/ingest_service.hpp>
#include <imgpipe/app/job_runner.hpp>
#include <imgpipe/app/stats.hpp>
#include <imgpipe/vision/mock_caption_model.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace ia = imgpipe::app;
namespace ic = imgpipe::core;
namespace il = imgpipe::ledger;
namespace is = imgpipe::storage;
namespace iv = imgpipe::vision;
namespace it = imgpipe::test;

using namespace std::chrono_literals;

namespace {

const ic::TimePoint kT0 = ic::from_epoch_ms(1'700'000'000'000);

/// Thread-safe queue that only records what it is given.
class RecordingQueue : public ia::IJobQueue {
 public:
  std::expected<ia::JobHandle, ic::EnqueueError> enqueue(ia::JobRequest request) override {
    std::lock_guard lock(mutex_);
    if (refuse_) return std::unexpected(ic::EnqueueError::ConnectionFailed);
    requests_.push_back(request);
    return ia::JobHandle{"job-" + std::to_string(requests_.size()), request.kind};
  }
  void wait_idle() override {}
  void shutdown() override {}

  void set_refuse(bool refuse) {
    std::lock_guard lock(mutex_);
    refuse_ = refuse;
  }
  std::vector<ia::JobRequest> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<ia::JobRequest> requests_;
  bool refuse_{false};
};

class IngestServiceTest : public ::testing::Test {
 protected:
  IngestServiceTest()
      : store_(dir_.path() / "media"),
        ledger_(dir_.file("ledger.db")),
        orchestrator_(queue_),
        service_(store_, ledger_, decoder_, orchestrator_, ia::IngestOptions{}, [this] { return tick(); }) {}

  ic::TimePoint tick() { return kT0 + std::chrono::seconds(clock_++); }

  ia::UploadResponse upload_ok(const std::string& name, const std::vector<std::byte>& bytes,
                               const std::string& type = "image/png") {
    auto r = service_.upload(name, type, bytes);
    EXPECT_TRUE(r.has_value());
    return r.value_or(ia::UploadResponse{});
  }

  it::TempDir dir_;
  is::ContentStore store_;
  il::Ledger ledger_;
  iv::OpenCvImageDecoder decoder_;
  RecordingQueue queue_;
  ia::JobOrchestrator orchestrator_;
  std::atomic<int> clock_{0};
  ia::IngestService service_;
};

bool is_lower_hex(const std::string& s) {
  return s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

}  // namespace

TEST_F(IngestServiceTest, ValidPngIsAcceptedAndJobsEnqueued) {
  const auto r = upload_ok("cat.png", it::make_png(10, 10));

  EXPECT_EQ(r.status, ia::UploadStatus::Success);
  EXPECT_FALSE(r.error.has_value());
  EXPECT_EQ(r.data.original_name, "cat.png");
  ASSERT_TRUE(r.data.stored_path.has_value());
  EXPECT_TRUE(store_.exists(*r.data.stored_path));
  ASSERT_TRUE(r.data.metadata.has_value());
  EXPECT_EQ(r.data.metadata->width, 10u);
  EXPECT_EQ(r.data.metadata->height, 10u);
  EXPECT_EQ(r.data.metadata->format, "png");
  EXPECT_EQ(r.data.metadata->sha256.size(), 64u);
  EXPECT_TRUE(is_lower_hex(r.data.metadata->sha256));
  EXPECT_FALSE(r.data.metadata->caption.has_value());

  ASSERT_EQ(r.data.thumbnails.size(), 2u);
  EXPECT_EQ(r.data.thumbnails.at("small"),
            "http://localhost:8000/api/images/" + r.data.image_id + "/thumbnails/small");
  EXPECT_EQ(r.data.thumbnails.at("medium"),
            "http://localhost:8000/api/images/" + r.data.image_id + "/thumbnails/medium");

  const auto requests = queue_.requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].content_hash, r.data.metadata->sha256);
  EXPECT_EQ(requests[0].stored_path, *r.data.stored_path);

  EXPECT_EQ(ledger_.find_outcome(r.data.image_id)->status, ic::OutcomeStatus::Pending);
}

TEST_F(IngestServiceTest, DisallowedExtensionIsRecordedAsFailedAttempt) {
  auto r = service_.upload("evil.xlsx", "image/png", it::make_png(4, 4));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ia::UploadStatus::Failed);
  EXPECT_EQ(r->error, "Bad Extension .xlsx");
  EXPECT_FALSE(r->data.metadata.has_value());
  EXPECT_TRUE(r->data.thumbnails.empty());

  auto stored = service_.get_image(r->data.image_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->error, "Bad Extension .xlsx");
  auto outcome = ledger_.find_outcome(r->data.image_id);
  EXPECT_EQ(outcome->status, ic::OutcomeStatus::Failed);
  EXPECT_EQ(outcome->end_time, outcome->start_time);

  EXPECT_EQ(ledger_.count_content_records(), 0u);
  EXPECT_TRUE(queue_.requests().empty());
}

TEST_F(IngestServiceTest, ThumbnailNotReadyUntilJobRuns) {
  const auto r = upload_ok("cat.png", it::make_png(10, 10));

  auto before = service_.get_thumbnail(r.data.image_id, "small");
  ASSERT_FALSE(before.has_value());
  EXPECT_EQ(before.error(), ic::LookupError::NotReady);

  iv::CaptionModelManager captions([] { return std::make_unique<iv::MockCaptionModel>(); });
  ia::JobRunner runner(store_, ledger_, decoder_, captions);
  ASSERT_TRUE(runner.run_thumbnail(r.data.metadata->sha256, *r.data.stored_path).has_value());

  auto after = service_.get_thumbnail(r.data.image_id, "small");
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(*after, store_.thumbnail_path(r.data.metadata->sha256, "small"));
}

TEST_F(IngestServiceTest, ThumbnailLookupErrors) {
  const auto ok = upload_ok("cat.png", it::make_png(10, 10));
  auto bad = service_.upload("cat.gif", "image/gif", it::make_png(10, 10));
  ASSERT_TRUE(bad.has_value());

  EXPECT_EQ(service_.get_thumbnail(ok.data.image_id, "huge").error(), ic::LookupError::InvalidSize);
  EXPECT_EQ(service_.get_thumbnail("no-such-id", "small").error(), ic::LookupError::NotFound);
  EXPECT_EQ(service_.get_thumbnail(bad->data.image_id, "small").error(), ic::LookupError::NotFound);
}

TEST_F(IngestServiceTest, DuplicateBytesShareOneContentRecord) {
  const auto bytes = it::make_png(12, 12, 3);
  const auto first = upload_ok("a.png", bytes);
  const auto second = upload_ok("b.png", bytes);

  EXPECT_NE(first.data.image_id, second.data.image_id);
  EXPECT_NE(*first.data.stored_path, *second.data.stored_path);
  EXPECT_EQ(first.data.metadata->sha256, second.data.metadata->sha256);
  EXPECT_EQ(second.data.metadata->first_upload, first.data.processed_at);
  EXPECT_EQ(ledger_.count_content_records(), 1u);
  EXPECT_EQ(ledger_.count_upload_attempts(), 2u);
  EXPECT_EQ(queue_.requests().size(), 3u);
}

TEST_F(IngestServiceTest, ConcurrentIdenticalUploadsEnqueueOnce) {
  const auto bytes = it::make_png(16, 16, 9);
  constexpr int kThreads = 8;
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto r = service_.upload("same.png", "image/png", bytes);
      if (r && r->status == ia::UploadStatus::Success) ++successes;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(successes.load(), kThreads);
  EXPECT_EQ(ledger_.count_content_records(), 1u);
  EXPECT_EQ(ledger_.count_upload_attempts(), static_cast<std::size_t>(kThreads));
  EXPECT_EQ(queue_.requests().size(), 3u);
}

TEST_F(IngestServiceTest, DuplicateOfCaptionedContentSucceedsImmediately) {
  const auto bytes = it::make_png(10, 10, 5);
  const auto first = upload_ok("a.png", bytes);
  ASSERT_TRUE(ledger_.complete_caption(first.data.metadata->sha256, "a small square", kT0 + 30s));

  const auto second = upload_ok("b.png", bytes);
  EXPECT_EQ(second.data.metadata->caption, "a small square");
  auto outcome = ledger_.find_outcome(second.data.image_id);
  EXPECT_EQ(outcome->status, ic::OutcomeStatus::Success);
  EXPECT_EQ(outcome->end_time, outcome->start_time);
  EXPECT_EQ(queue_.requests().size(), 3u);
}

TEST_F(IngestServiceTest, DuplicateAfterCaptionFailureIsSettledAsFailed) {
  const auto bytes = it::make_png(10, 10, 6);
  const auto first = upload_ok("a.png", bytes);
  const std::string sha = first.data.metadata->sha256;
  ASSERT_EQ(ledger_.settle_pending_outcomes(sha, ic::OutcomeStatus::Failed, kT0 + 30s), 1u);

  const auto second = upload_ok("b.png", bytes);
  EXPECT_EQ(second.status, ia::UploadStatus::Success);
  auto outcome = ledger_.find_outcome(second.data.image_id);
  EXPECT_EQ(outcome->status, ic::OutcomeStatus::Failed);
  ASSERT_TRUE(outcome->end_time.has_value());
  EXPECT_EQ(outcome->end_time, outcome->start_time);
  EXPECT_EQ(queue_.requests().size(), 3u);

  const auto stats = ia::compute_stats(ledger_);
  EXPECT_EQ(stats.failed, 2u);
}

TEST_F(IngestServiceTest, RetriggerReopensFailedCaptionStage) {
  const auto bytes = it::make_png(10, 10, 7);
  const auto first = upload_ok("a.png", bytes);
  const std::string sha = first.data.metadata->sha256;
  (void)ledger_.settle_pending_outcomes(sha, ic::OutcomeStatus::Failed, kT0 + 30s);

  ASSERT_TRUE(service_.retrigger(sha).has_value());
  EXPECT_EQ(ledger_.find_content_record(sha)->caption_status, ic::OutcomeStatus::Pending);

  const auto second = upload_ok("b.png", bytes);
  EXPECT_EQ(ledger_.find_outcome(second.data.image_id)->status, ic::OutcomeStatus::Pending);
  ASSERT_TRUE(ledger_.complete_caption(sha, "a small square", kT0 + 40s));
  EXPECT_EQ(ledger_.find_outcome(second.data.image_id)->status, ic::OutcomeStatus::Success);
  EXPECT_EQ(ledger_.find_outcome(first.data.image_id)->status, ic::OutcomeStatus::Failed);
}

TEST_F(IngestServiceTest, OversizedHeaderIsRejectedWithoutDecoding) {
  auto r = service_.upload("bomb.png", "image/png", it::make_png_header(20000, 20000));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ia::UploadStatus::Failed);
  EXPECT_EQ(r->error, "Image dimensions exceed pixel limit");
  EXPECT_EQ(ledger_.count_content_records(), 0u);
  EXPECT_TRUE(queue_.requests().empty());
}

TEST_F(IngestServiceTest, StorageFailureRecordsAttemptAndReturnsError) {
  const auto blocker = dir_.path() / "blocked";
  { std::ofstream(blocker) << "x"; }
  is::ContentStore broken(blocker);
  ia::IngestService service(broken, ledger_, decoder_, orchestrator_);

  auto r = service.upload("cat.png", "image/png", it::make_png(10, 10));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::StorageError::CreateDirectoryFailed);

  const auto all = service.list_images();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].status, ia::UploadStatus::Failed);
  EXPECT_EQ(all[0].error, "Failed to save image");
  EXPECT_EQ(ledger_.count_content_records(), 0u);
}

TEST_F(IngestServiceTest, EnqueueFailureKeepsUploadAndRetriggerRecovers) {
  queue_.set_refuse(true);
  const auto r = upload_ok("cat.png", it::make_png(10, 10));
  EXPECT_EQ(r.status, ia::UploadStatus::Success);
  EXPECT_TRUE(queue_.requests().empty());
  ASSERT_TRUE(ledger_.find_content_record(r.data.metadata->sha256).has_value());

  queue_.set_refuse(false);
  auto jobs = service_.retrigger(r.data.metadata->sha256);
  ASSERT_TRUE(jobs.has_value());
  const auto requests = queue_.requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[2].kind, ia::JobKind::Caption);
  EXPECT_EQ(requests[2].stored_path, *r.data.stored_path);
}

TEST_F(IngestServiceTest, RetriggerUnknownContent) {
  auto jobs = service_.retrigger(std::string(64, '0'));
  ASSERT_FALSE(jobs.has_value());
  EXPECT_EQ(jobs.error(), ic::EnqueueError::UnknownContent);
}

TEST_F(IngestServiceTest, ListIsNewestFirst) {
  const auto a = upload_ok("a.png", it::make_png(4, 4, 1));
  const auto b = upload_ok("b.jpg", it::make_jpeg(4, 4, 2), "image/jpeg");
  auto c = service_.upload("c.txt", "text/plain", it::to_bytes("hello"));
  ASSERT_TRUE(c.has_value());

  const auto all = service_.list_images();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].data.image_id, c->data.image_id);
  EXPECT_EQ(all[1].data.image_id, b.data.image_id);
  EXPECT_EQ(all[2].data.image_id, a.data.image_id);
  EXPECT_EQ(all[1].data.metadata->format, "jpeg");

  EXPECT_FALSE(service_.get_image("missing").has_value());
}
