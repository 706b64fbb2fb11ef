#include <imgpipe/ledger/ledger.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace ic = imgpipe::core;
namespace il = imgpipe::ledger;
namespace it = imgpipe::test;

using namespace std::chrono_literals;

namespace {

const ic::TimePoint kT0 = ic::from_epoch_ms(1'700'000'000'000);

const std::string kHashA(64, 'a');
const std::string kHashB(64, 'b');

ic::ContentDescriptor descriptor() { return {10, 10, "png", 1234}; }

ic::UploadAttempt attempt(const std::string& id, std::optional<std::string> hash, ic::TimePoint at,
                          std::optional<std::string> error = std::nullopt) {
  ic::UploadAttempt a;
  a.attempt_id = id;
  a.original_name = id + ".png";
  a.processed_at = at;
  if (hash) a.stored_path = "/media/originals/" + id + ".png";
  a.content_hash = std::move(hash);
  a.error = std::move(error);
  return a;
}

ic::ProcessingOutcome pending(const std::string& id, ic::TimePoint start) {
  return {id, start, std::nullopt, ic::OutcomeStatus::Pending};
}

class LedgerTest : public ::testing::Test {
 protected:
  it::TempDir dir_;
  std::string db_path_ = dir_.file("ledger.db");
  il::Ledger ledger_{db_path_};
};

}  // namespace

TEST_F(LedgerTest, FirstInsertIsNewSecondReturnsExisting) {
  auto first = ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  EXPECT_TRUE(first.was_new);
  EXPECT_EQ(first.record.content_hash, kHashA);
  EXPECT_EQ(first.record.width, 10u);
  EXPECT_EQ(first.record.format, "png");
  EXPECT_EQ(first.record.size_bytes, 1234u);
  EXPECT_EQ(first.record.first_seen, kT0);
  EXPECT_FALSE(first.record.caption.has_value());

  auto second = ledger_.get_or_create_content_record(kHashA, {99, 99, "jpeg", 1}, kT0 + 5s);
  EXPECT_FALSE(second.was_new);
  EXPECT_EQ(second.record.width, 10u);
  EXPECT_EQ(second.record.first_seen, kT0);
  EXPECT_EQ(ledger_.count_content_records(), 1u);
}

TEST_F(LedgerTest, ConcurrentIdenticalInsertsYieldExactlyOneNew) {
  constexpr int kThreads = 16;
  std::atomic<int> new_count{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (ledger_.get_or_create_content_record(kHashA, descriptor(), kT0).was_new) ++new_count;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(new_count.load(), 1);
  EXPECT_EQ(ledger_.count_content_records(), 1u);
}

TEST_F(LedgerTest, ConcurrentInsertsAcrossConnectionsYieldExactlyOneNew) {
  constexpr int kConnections = 4;
  std::vector<std::unique_ptr<il::Ledger>> ledgers;
  for (int i = 0; i < kConnections; ++i) {
    ledgers.push_back(std::make_unique<il::Ledger>(db_path_));
  }
  std::atomic<int> new_count{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kConnections * 4; ++i) {
    il::Ledger& l = *ledgers[static_cast<std::size_t>(i % kConnections)];
    threads.emplace_back([&l, &new_count] {
      if (l.get_or_create_content_record(kHashB, descriptor(), kT0).was_new) ++new_count;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(new_count.load(), 1);
  EXPECT_EQ(ledger_.count_content_records(), 1u);
}

TEST_F(LedgerTest, RecordsAttemptWithOutcome) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  ledger_.record_upload_attempt(attempt("u1", kHashA, kT0), pending("u1", kT0));

  auto view = ledger_.find_upload("u1");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->attempt.original_name, "u1.png");
  EXPECT_EQ(view->attempt.content_hash, kHashA);
  ASSERT_TRUE(view->content.has_value());
  EXPECT_EQ(view->content->content_hash, kHashA);

  auto outcome = ledger_.find_outcome("u1");
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->status, ic::OutcomeStatus::Pending);
  EXPECT_FALSE(outcome->end_time.has_value());
}

TEST_F(LedgerTest, FailedAttemptHasNoContentLink) {
  ledger_.record_upload_attempt(attempt("bad", std::nullopt, kT0, "Bad Extension .xlsx"),
                                {"bad", kT0, kT0, ic::OutcomeStatus::Failed});
  auto view = ledger_.find_upload("bad");
  ASSERT_TRUE(view.has_value());
  EXPECT_FALSE(view->content.has_value());
  EXPECT_FALSE(view->attempt.stored_path.has_value());
  EXPECT_EQ(view->attempt.error, "Bad Extension .xlsx");
  EXPECT_EQ(ledger_.find_outcome("bad")->status, ic::OutcomeStatus::Failed);
}

TEST_F(LedgerTest, AttemptForUnknownContentViolatesForeignKey) {
  EXPECT_THROW(ledger_.record_upload_attempt(attempt("u1", kHashB, kT0), pending("u1", kT0)),
               il::LedgerException);
  EXPECT_EQ(ledger_.count_upload_attempts(), 0u);
}

TEST_F(LedgerTest, OutcomeLeavesPendingOnlyOnce) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  ledger_.record_upload_attempt(attempt("u1", kHashA, kT0), pending("u1", kT0));

  EXPECT_TRUE(ledger_.record_outcome("u1", ic::OutcomeStatus::Success, kT0 + 2s));
  EXPECT_FALSE(ledger_.record_outcome("u1", ic::OutcomeStatus::Failed, kT0 + 3s));
  EXPECT_FALSE(ledger_.record_outcome("nope", ic::OutcomeStatus::Failed, kT0));

  auto o = ledger_.find_outcome("u1");
  EXPECT_EQ(o->status, ic::OutcomeStatus::Success);
  EXPECT_EQ(o->end_time, kT0 + 2s);
}

TEST_F(LedgerTest, ContentFieldsUpdateIndependently) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  EXPECT_TRUE(ledger_.update_content_field(kHashA, il::ContentField::ExifJson, "{\"Make\":\"Canon\"}"));
  EXPECT_TRUE(ledger_.update_content_field(kHashA, il::ContentField::Caption, "a cat"));
  EXPECT_FALSE(ledger_.update_content_field(kHashB, il::ContentField::Caption, "nobody"));

  auto r = ledger_.find_content_record(kHashA);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exif_json, "{\"Make\":\"Canon\"}");
  EXPECT_EQ(r->caption, "a cat");
}

TEST_F(LedgerTest, CompleteCaptionSettlesEveryPendingAttemptOfTheHash) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  (void)ledger_.get_or_create_content_record(kHashB, descriptor(), kT0);
  ledger_.record_upload_attempt(attempt("u1", kHashA, kT0), pending("u1", kT0));
  ledger_.record_upload_attempt(attempt("u2", kHashA, kT0 + 1s), pending("u2", kT0 + 1s));
  ledger_.record_upload_attempt(attempt("u3", kHashB, kT0), pending("u3", kT0));

  EXPECT_TRUE(ledger_.complete_caption(kHashA, "two cats", kT0 + 4s));
  EXPECT_EQ(ledger_.find_content_record(kHashA)->caption, "two cats");
  EXPECT_EQ(ledger_.find_outcome("u1")->status, ic::OutcomeStatus::Success);
  EXPECT_EQ(ledger_.find_outcome("u2")->end_time, kT0 + 4s);
  EXPECT_EQ(ledger_.find_outcome("u3")->status, ic::OutcomeStatus::Pending);

  EXPECT_FALSE(ledger_.complete_caption(std::string(64, 'c'), "ghost", kT0));
}

TEST_F(LedgerTest, SettlePendingAsFailed) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  ledger_.record_upload_attempt(attempt("u1", kHashA, kT0), pending("u1", kT0));
  ledger_.record_upload_attempt(attempt("u2", kHashA, kT0), {"u2", kT0, kT0, ic::OutcomeStatus::Success});

  EXPECT_EQ(ledger_.settle_pending_outcomes(kHashA, ic::OutcomeStatus::Failed, kT0 + 1s), 1u);
  EXPECT_EQ(ledger_.find_outcome("u1")->status, ic::OutcomeStatus::Failed);
  EXPECT_EQ(ledger_.find_outcome("u2")->status, ic::OutcomeStatus::Success);
}

TEST_F(LedgerTest, CaptionStatusTracksCaptionStage) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  (void)ledger_.get_or_create_content_record(kHashB, descriptor(), kT0);
  EXPECT_EQ(ledger_.find_content_record(kHashA)->caption_status, ic::OutcomeStatus::Pending);

  // Settles even with no attempt linked yet.
  EXPECT_EQ(ledger_.settle_pending_outcomes(kHashA, ic::OutcomeStatus::Failed, kT0 + 1s), 0u);
  EXPECT_EQ(ledger_.find_content_record(kHashA)->caption_status, ic::OutcomeStatus::Failed);

  EXPECT_TRUE(ledger_.reopen_caption(kHashA));
  EXPECT_EQ(ledger_.find_content_record(kHashA)->caption_status, ic::OutcomeStatus::Pending);
  EXPECT_FALSE(ledger_.reopen_caption(kHashA));

  ASSERT_TRUE(ledger_.complete_caption(kHashB, "a dog", kT0 + 2s));
  EXPECT_EQ(ledger_.find_content_record(kHashB)->caption_status, ic::OutcomeStatus::Success);
  // A later failed re-run does not demote captioned content.
  (void)ledger_.settle_pending_outcomes(kHashB, ic::OutcomeStatus::Failed, kT0 + 3s);
  EXPECT_EQ(ledger_.find_content_record(kHashB)->caption_status, ic::OutcomeStatus::Success);
  EXPECT_FALSE(ledger_.reopen_caption(kHashB));
}

TEST_F(LedgerTest, ListUploadsNewestFirstAndStoredPathLookup) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  ledger_.record_upload_attempt(attempt("old", kHashA, kT0), pending("old", kT0));
  ledger_.record_upload_attempt(attempt("new", kHashA, kT0 + 10s), pending("new", kT0 + 10s));
  ledger_.record_upload_attempt(attempt("bad", std::nullopt, kT0 + 5s, "Empty upload"),
                                {"bad", kT0 + 5s, kT0 + 5s, ic::OutcomeStatus::Failed});

  const auto list = ledger_.list_uploads();
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].attempt.attempt_id, "new");
  EXPECT_EQ(list[1].attempt.attempt_id, "bad");
  EXPECT_EQ(list[2].attempt.attempt_id, "old");

  EXPECT_EQ(ledger_.find_stored_path(kHashA), "/media/originals/old.png");
  EXPECT_FALSE(ledger_.find_stored_path(kHashB).has_value());
  EXPECT_EQ(ledger_.list_outcomes().size(), 3u);
}

TEST_F(LedgerTest, DataSurvivesReopen) {
  (void)ledger_.get_or_create_content_record(kHashA, descriptor(), kT0);
  il::Ledger reopened(db_path_);
  EXPECT_TRUE(reopened.find_content_record(kHashA).has_value());
  EXPECT_FALSE(reopened.get_or_create_content_record(kHashA, descriptor(), kT0).was_new);
}

TEST(Ledger, OpenFailureThrows) {
  EXPECT_THROW(il::Ledger("/nonexistent-dir-imgpipe/sub/ledger.db"), std::runtime_error);
}
