#include <imgpipe/core/error.hpp>
#include <imgpipe/core/records.hpp>
#include <gtest/gtest.h>
#include <chrono>

namespace ic = imgpipe::core;

TEST(Records, FormatTimestampIsUtcWithMillis) {
  const ic::TimePoint t = ic::from_epoch_ms(1714564800250);  // 2024-05-01T12:00:00.250Z
  EXPECT_EQ(ic::format_timestamp(t), "2024-05-01T12:00:00.250Z");
  EXPECT_EQ(ic::format_timestamp(ic::from_epoch_ms(0)), "1970-01-01T00:00:00.000Z");
}

TEST(Records, EpochMillisRoundTripTruncatesSubMillis) {
  const ic::TimePoint t = ic::from_epoch_ms(1'700'000'000'123) + std::chrono::microseconds(456);
  EXPECT_EQ(ic::to_epoch_ms(t), 1'700'000'000'123);
}

TEST(Records, ValidatedUploadSentinel) {
  ic::ValidatedUpload v;
  EXPECT_FALSE(v.has_dimensions());
  v.width = 10;
  v.height = 10;
  EXPECT_TRUE(v.has_dimensions());
}

TEST(Records, StatusAndErrorNames) {
  EXPECT_EQ(ic::to_string(ic::OutcomeStatus::Pending), "pending");
  EXPECT_EQ(ic::to_string(ic::OutcomeStatus::Success), "success");
  EXPECT_EQ(ic::to_string(ic::OutcomeStatus::Failed), "failed");
  EXPECT_FALSE(ic::to_string(ic::ValidationError::SignatureMismatch).empty());
  EXPECT_FALSE(ic::to_string(ic::EnqueueError::QueueFull).empty());
  EXPECT_FALSE(ic::to_string(ic::LookupError::NotReady).empty());
}
