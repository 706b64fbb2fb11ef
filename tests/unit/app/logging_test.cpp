#include <imgpipe/app/logging.hpp>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

namespace ia = imgpipe::app;

TEST(Logging, InstallsNamedDefaultLogger) {
  ia::init_logging("debug");
  auto logger = spdlog::get("imgpipe");
  ASSERT_TRUE(logger);
  EXPECT_EQ(spdlog::default_logger(), logger);
  EXPECT_EQ(logger->level(), spdlog::level::debug);
}

TEST(Logging, RepeatCallsReconfigureAndUnknownLevelIsInfo) {
  ia::init_logging("warn");
  EXPECT_EQ(spdlog::get("imgpipe")->level(), spdlog::level::warn);
  ia::init_logging("chatty");
  EXPECT_EQ(spdlog::get("imgpipe")->level(), spdlog::level::info);
  ia::init_logging("off");
  EXPECT_EQ(spdlog::get("imgpipe")->level(), spdlog::level::off);
  ia::init_logging("info");
}
