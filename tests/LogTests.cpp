#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "core/log/Log.h"

namespace {

std::string tempLogFile() {
  return (std::filesystem::temp_directory_path() / "squad-roulette-test.log").string();
}

} // namespace

TEST(LogTest, InitInstallsNamedDefaultLogger) {
  logging::init(tempLogFile());
  const auto logger = spdlog::get(logging::kLoggerName);
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(spdlog::default_logger(), logger);
  EXPECT_EQ(logger->sinks().size(), 2u);

  // 再次调用不替换已有日志器
  logging::init(tempLogFile());
  EXPECT_EQ(spdlog::get(logging::kLoggerName), logger);
}

TEST(LogTest, ApplyLevelAcceptsKnownNamesOnly) {
  logging::init(tempLogFile());

  EXPECT_TRUE(logging::applyLevel("debug"));
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

  EXPECT_FALSE(logging::applyLevel("loud"));
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

  EXPECT_TRUE(logging::applyLevel("off"));
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);

  EXPECT_TRUE(logging::applyLevel("trace"));
}
