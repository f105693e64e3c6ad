// Repository: Toolshed
// Component: Logger Tests
// Purpose: Sink capture, level names and whole-line emission across threads.
// Copyright (c) 2025 Toolshed

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "toolshed/util/Logger.hpp"

namespace toolshed::util::testing {
namespace {

class LoggerTests : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetQuiet(true);
    Logger::SetSink([this](Logger::Level level, const std::string& line) {
      std::lock_guard<std::mutex> lock(mutex_);
      captured_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetSink(nullptr);
    Logger::SetQuiet(false);
  }

  std::vector<std::pair<Logger::Level, std::string>> Captured() {
    std::lock_guard<std::mutex> lock(mutex_);
    return captured_;
  }

  std::mutex mutex_;
  std::vector<std::pair<Logger::Level, std::string>> captured_;
};

TEST_F(LoggerTests, SinkSeesEveryLevelInOrder) {
  Logger::Info("[Test] INFO_LINE");
  Logger::Debug("[Test] DEBUG_LINE");
  Logger::Warn("[Test] WARN_LINE");
  Logger::Error("[Test] ERROR_LINE");

  auto lines = Captured();
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].first, Logger::Level::kInfo);
  EXPECT_EQ(lines[0].second, "[Test] INFO_LINE");
  // Debug reaches the sink even without TOOLSHED_DEBUG.
  EXPECT_EQ(lines[1].first, Logger::Level::kDebug);
  EXPECT_EQ(lines[2].first, Logger::Level::kWarn);
  EXPECT_EQ(lines[3].first, Logger::Level::kError);
}

TEST_F(LoggerTests, ClearedSinkReceivesNothing) {
  Logger::SetSink(nullptr);
  Logger::Warn("[Test] DROPPED");
  EXPECT_TRUE(Captured().empty());
}

TEST_F(LoggerTests, ConcurrentWritersDeliverWholeLines) {
  constexpr int kThreads = 4;
  constexpr int kLinesPerThread = 200;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < kLinesPerThread; ++i) {
        Logger::Info("[Test] LINE thread=" + std::to_string(t) + " i=" + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto lines = Captured();
  ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kLinesPerThread));
  for (const auto& entry : lines) {
    EXPECT_EQ(entry.second.rfind("[Test] LINE thread=", 0), 0u);
  }
}

TEST(LoggerLevelTests, LevelNames) {
  EXPECT_STREQ(Logger::LevelName(Logger::Level::kDebug), "DEBUG");
  EXPECT_STREQ(Logger::LevelName(Logger::Level::kInfo), "INFO");
  EXPECT_STREQ(Logger::LevelName(Logger::Level::kWarn), "WARN");
  EXPECT_STREQ(Logger::LevelName(Logger::Level::kError), "ERROR");
}

}  // namespace
}  // namespace toolshed::util::testing
