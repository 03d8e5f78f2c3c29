#include "taskweave/util/log.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskweave;

namespace {

auto count_of(const std::string& text, std::string_view needle) -> std::size_t {
  std::size_t count = 0;
  for (auto pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

TEST(LoggerTest, WritesSynchronouslyWhenNotStarted) {
  log::Logger logger;
  logger.set_color(false);

  ::testing::internal::CaptureStderr();
  logger.log(log::Level::Warn, "before start {}", 1);
  auto out = ::testing::internal::GetCapturedStderr();

  EXPECT_NE(out.find("[warn]"), std::string::npos);
  EXPECT_NE(out.find("before start 1"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowLevel) {
  log::Logger logger;
  logger.set_color(false);
  logger.set_level(log::Level::Error);

  ::testing::internal::CaptureStderr();
  logger.log(log::Level::Info, "hidden");
  logger.log(log::Level::Error, "shown");
  auto out = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("shown"), std::string::npos);
}

TEST(LoggerTest, StopWhileProducersRunKeepsEveryMessage) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 2000;
  log::Logger logger;
  logger.set_color(false);

  ::testing::internal::CaptureStderr();
  logger.start();

  std::atomic<int> started{0};
  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&]() {
      started.fetch_add(1);
      for (int i = 0; i < kPerThread; ++i) {
        logger.log(log::Level::Info, "entry {}", i);
      }
    });
  }
  while (started.load() < kThreads) {
    std::this_thread::yield();
  }
  logger.stop();
  for (auto& t : producers) {
    t.join();
  }
  auto out = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(count_of(out, "entry "),
            static_cast<std::size_t>(kThreads * kPerThread));
}
