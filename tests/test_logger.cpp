// Repository: Montage-preview
// Component: Logger Tests
// Purpose: Verify per-level test sinks, the debug gate and whole-line output
//          under concurrency.
// Copyright (c) 2025 Montage

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include "montage/util/Logger.hpp"

namespace montage::util::testing {
namespace {

class LoggerSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetInfoSink([this](const std::string& line) { infos_.push_back(line); });
    Logger::SetWarnSink([this](const std::string& line) { warnings_.push_back(line); });
    Logger::SetErrorSink([this](const std::string& line) { errors_.push_back(line); });
  }
  void TearDown() override {
    Logger::SetInfoSink(nullptr);
    Logger::SetWarnSink(nullptr);
    Logger::SetErrorSink(nullptr);
    unsetenv("MONTAGE_DEBUG");
  }

  std::vector<std::string> infos_;
  std::vector<std::string> warnings_;
  std::vector<std::string> errors_;
};

TEST_F(LoggerSinkTest, SinksReceiveTheirLevelOnly) {
  Logger::Info("[Test] info line");
  Logger::Warn("[Test] warn line");
  Logger::Error("[Test] error line");
  Logger::Debug("[Test] debug line");

  EXPECT_EQ(infos_, std::vector<std::string>{"[Test] info line"});
  EXPECT_EQ(warnings_, std::vector<std::string>{"[Test] warn line"});
  EXPECT_EQ(errors_, std::vector<std::string>{"[Test] error line"});
}

TEST_F(LoggerSinkTest, DebugGateFollowsEnvironment) {
  unsetenv("MONTAGE_DEBUG");
  EXPECT_FALSE(Logger::DebugEnabled());

  setenv("MONTAGE_DEBUG", "0", 1);
  EXPECT_FALSE(Logger::DebugEnabled());

  setenv("MONTAGE_DEBUG", "1", 1);
  EXPECT_TRUE(Logger::DebugEnabled());
}

TEST_F(LoggerSinkTest, ConcurrentLinesAreNotLost) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 50; ++i) {
        Logger::Error("[Test] thread " + std::to_string(t) + " line " + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(errors_.size(), 200u);
}

}  // namespace
}  // namespace montage::util::testing
