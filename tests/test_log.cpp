#include <gtest/gtest.h>

#include <thread>

#include "FakeHost.h"

using Popup_lib::test::LogCapture;

TEST(Log, FormatsAndPrefixesByLevel)
{
  LogCapture log;
  base::Log("loaded %d popups", 3);
  base::LogWarning("slow frame %.1f ms", 20.5);
  base::LogError("missing %s", "font");

  ASSERT_EQ(log.lines.size(), 3u);
  EXPECT_EQ(log.lines[0].first, base::LogLevel::Info);
  EXPECT_EQ(log.lines[0].second, "loaded 3 popups");
  EXPECT_EQ(log.lines[1].first, base::LogLevel::Warning);
  EXPECT_EQ(log.lines[1].second, "[warning] slow frame 20.5 ms");
  EXPECT_EQ(log.lines[2].first, base::LogLevel::Error);
  EXPECT_EQ(log.lines[2].second, "[error] missing font");
}

TEST(Log, StringOverloadIsNotAFormat)
{
  LogCapture log;
  base::Log(std::string("100% done"));
  ASSERT_EQ(log.lines.size(), 1u);
  EXPECT_EQ(log.lines[0].second, "100% done");
}

TEST(Log, LongMessagesAreNotTruncated)
{
  LogCapture log;
  const std::string big(5000, 'x');
  base::Log("%s!", big.c_str());
  ASSERT_EQ(log.lines.size(), 1u);
  EXPECT_EQ(log.lines[0].second.size(), 5001u);
}

TEST(Log, ConcurrentWritersProduceWholeLines)
{
  LogCapture log;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t)
    threads.emplace_back([t] { for (int i = 0; i < 100; ++i) base::Log("thread %d line %d", t, i); });
  for (auto& th : threads) th.join();

  EXPECT_EQ(log.lines.size(), 400u);
  for (const auto& l : log.lines) EXPECT_EQ(l.second.rfind("thread ", 0), 0u);
}

TEST(Log, RemovedSinkStopsReceiving)
{
  size_t seen = 0;
  {
    LogCapture log;
    base::Log("one");
    seen = log.lines.size();
  }
  EXPECT_EQ(seen, 1u);
  testing::internal::CaptureStdout();
  base::Log("back on stdout");
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "back on stdout\n");
}
