#include <imgpipe/vision/caption_model.hpp>
#include <imgpipe/vision/mock_caption_model.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ic = imgpipe::core;
namespace iv = imgpipe::vision;

namespace {

ic::Frame make_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(static_cast<std::size_t>(w) * h * 3, std::byte{0});
  return ic::Frame(w, h, ic::PixelFormat::BGR8, std::move(buffer));
}

}  // namespace

TEST(MockCaptionModel, ReturnsConfiguredCaption) {
  iv::MockCaptionModel model("a cat on a sofa");
  auto c = model.caption(make_frame(64, 32));
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, "a cat on a sofa");
  EXPECT_EQ(model.caption_calls(), 1u);
  EXPECT_EQ(model.last_longest_edge(), 64u);

  model.set_caption("a dog");
  EXPECT_EQ(*model.caption(make_frame(8, 8)), "a dog");
}

TEST(MockCaptionModel, FailureAndEmptyFrame) {
  iv::MockCaptionModel model;
  EXPECT_EQ(model.caption(ic::Frame{}).error(), ic::JobError::DecodeFailed);
  model.set_failure(ic::JobError::ModelFailed);
  EXPECT_EQ(model.caption(make_frame(4, 4)).error(), ic::JobError::ModelFailed);
  model.set_failure(std::nullopt);
  EXPECT_TRUE(model.caption(make_frame(4, 4)).has_value());
}

TEST(CaptionModelManager, RejectsEmptyFactory) {
  EXPECT_THROW(iv::CaptionModelManager(iv::CaptionModelManager::Factory{}), std::invalid_argument);
}

TEST(CaptionModelManager, BuildsLazilyOnceAndSharesModel) {
  int builds = 0;
  iv::CaptionModelManager manager([&builds] {
    ++builds;
    return std::make_unique<iv::MockCaptionModel>();
  });
  EXPECT_FALSE(manager.loaded());
  EXPECT_EQ(builds, 0);

  auto a = manager.acquire();
  auto b = manager.acquire();
  EXPECT_TRUE(manager.loaded());
  EXPECT_EQ(builds, 1);
  EXPECT_EQ(a.get(), b.get());
}

TEST(CaptionModelManager, WarmupLoadsAndWarmsModel) {
  iv::MockCaptionModel* raw = nullptr;
  iv::CaptionModelManager manager([&raw] {
    auto m = std::make_unique<iv::MockCaptionModel>();
    raw = m.get();
    return m;
  });
  manager.warmup();
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->warmup_calls(), 1u);
  EXPECT_TRUE(manager.loaded());
}

TEST(CaptionModelManager, ReleaseKeepsInFlightReferenceAlive) {
  int builds = 0;
  iv::CaptionModelManager manager([&builds] {
    ++builds;
    return std::make_unique<iv::MockCaptionModel>("held");
  });
  auto held = manager.acquire();
  manager.release();
  EXPECT_FALSE(manager.loaded());
  EXPECT_EQ(*held->caption(make_frame(2, 2)), "held");

  auto fresh = manager.acquire();
  EXPECT_EQ(builds, 2);
  EXPECT_NE(fresh.get(), held.get());
}

TEST(CaptionModelManager, FactoryReturningNullThrows) {
  iv::CaptionModelManager manager([] { return std::unique_ptr<iv::ICaptionModel>{}; });
  EXPECT_THROW((void)manager.acquire(), std::runtime_error);
  EXPECT_FALSE(manager.loaded());
}

TEST(CaptionModelManager, ConcurrentAcquireBuildsOnce) {
  std::atomic<int> builds{0};
  iv::CaptionModelManager manager([&builds] {
    ++builds;
    return std::make_unique<iv::MockCaptionModel>();
  });
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&manager] { (void)manager.acquire(); });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(builds.load(), 1);
}
