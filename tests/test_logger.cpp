// Repository: BatchScribe
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::util {
namespace {

TEST(LoggerTest, SinksReceiveTheirLevelOnly) {
  std::vector<std::string> infos;
  std::vector<std::string> errors;
  Logger::SetInfoSink([&](const std::string& l) { infos.push_back(l); });
  Logger::SetErrorSink([&](const std::string& l) { errors.push_back(l); });

  Logger::Info("[LoggerTest] info line");
  Logger::Warn("[LoggerTest] warn line");
  Logger::Error("[LoggerTest] error line");

  Logger::SetInfoSink(nullptr);
  Logger::SetErrorSink(nullptr);

  ASSERT_EQ(infos.size(), 1u);
  EXPECT_EQ(infos[0], "[LoggerTest] info line");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "[LoggerTest] error line");
}

TEST(LoggerTest, ConcurrentCallersDeliverWholeLines) {
  std::atomic<int> seen{0};
  Logger::SetErrorSink([&](const std::string& l) {
    if (l.rfind("[LoggerTest] t", 0) == 0) seen++;
  });

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 50; ++i) {
        Logger::Error("[LoggerTest] t" + std::to_string(t) + " i=" + std::to_string(i));
      }
    });
  }
  for (auto& th : threads) th.join();
  Logger::SetErrorSink(nullptr);

  EXPECT_EQ(seen.load(), 200);
}

}  // namespace
}  // namespace batchscribe::util
