#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <popup_lib/RedrawPort.h>
#include <popup_lib/TaskRunner.h>
#include <popup_lib/UiTaskQueue.h>

#include "FakeHost.h"

using namespace Popup_lib;
using namespace Popup_lib::test;
using namespace std::chrono_literals;

TEST(TaskRunner, RunsSubmittedJobs)
{
  TaskRunner runner(2);
  EXPECT_EQ(runner.workerCount(), 2u);
  EXPECT_FALSE(runner.isRunning());

  std::atomic<int> sum{ 0 };
  std::vector<std::future<bool>> done;
  for (int i = 1; i <= 10; ++i) done.push_back(runner.submit([&sum, i] { sum += i; }));
  EXPECT_TRUE(runner.isRunning());

  for (auto& f : done) EXPECT_TRUE(f.get());
  EXPECT_EQ(sum.load(), 55);
}

TEST(TaskRunner, DefaultsToAtLeastOneWorker)
{
  TaskRunner runner;
  EXPECT_GE(runner.workerCount(), 1u);
}

TEST(TaskRunner, ThrowingJobReportsFalseAndLogs)
{
  LogCapture log;
  TaskRunner runner(1);
  auto bad = runner.submit([] { throw std::runtime_error("export failed"); });
  auto good = runner.submit([] {});

  EXPECT_FALSE(bad.get());
  EXPECT_TRUE(good.get());
  EXPECT_EQ(log.count(base::LogLevel::Error), 1u);
}

TEST(TaskRunner, PausedJobsWaitUntilResumed)
{
  TaskRunner runner(1);
  runner.start();
  runner.pause();
  EXPECT_TRUE(runner.isPaused());

  std::atomic<bool> ran{ false };
  auto f = runner.submit([&] { ran = true; });
  EXPECT_EQ(f.wait_for(50ms), std::future_status::timeout);
  EXPECT_FALSE(ran.load());
  EXPECT_EQ(runner.pendingCount(), 1u);

  runner.resume();
  EXPECT_TRUE(f.get());
  EXPECT_TRUE(ran.load());
  EXPECT_EQ(runner.pendingCount(), 0u);
}

TEST(TaskRunner, CancelAllResolvesQueuedJobs)
{
  TaskRunner runner(1);
  runner.start();
  runner.pause();

  std::atomic<int> ran{ 0 };
  auto a = runner.submit([&] { ++ran; });
  auto b = runner.submit([&] { ++ran; });
  EXPECT_EQ(runner.cancelAll(), 2u);
  EXPECT_FALSE(a.get());
  EXPECT_FALSE(b.get());

  runner.resume();
  EXPECT_TRUE(runner.submit([&] { ++ran; }).get());
  EXPECT_EQ(ran.load(), 1);
}

TEST(TaskRunner, StopCancelsPendingAndRejectsNewWork)
{
  TaskRunner runner(1);
  runner.start();
  runner.pause();
  auto queued = runner.submit([] {});

  runner.stop();
  EXPECT_FALSE(queued.get());
  EXPECT_FALSE(runner.isRunning());

  auto late = runner.submit([] {});
  ASSERT_EQ(late.wait_for(0ms), std::future_status::ready);
  EXPECT_FALSE(late.get());
}

TEST(TaskRunner, StoppedRunnerStaysStopped)
{
  TaskRunner runner(1);
  runner.start();
  runner.stop();

  runner.start();
  EXPECT_FALSE(runner.isRunning());
  auto late = runner.submit([] {});
  EXPECT_FALSE(late.get());
  EXPECT_FALSE(runner.isRunning());
}

TEST(TaskRunner, SubmitRacingStopNeverRestartsThePool)
{
  for (int round = 0; round < 20; ++round) {
    TaskRunner runner(2);
    std::vector<std::future<bool>> futures;
    std::thread producer([&] {
      for (int i = 0; i < 200; ++i) futures.push_back(runner.submit([] {}));
    });
    std::this_thread::yield();
    runner.stop();
    producer.join();

    EXPECT_FALSE(runner.isRunning());
    EXPECT_EQ(runner.pendingCount(), 0u);
    for (auto& f : futures) ASSERT_EQ(f.wait_for(1s), std::future_status::ready);
  }
}

TEST(TaskRunner, StopWaitsForRunningJob)
{
  std::atomic<bool> finished{ false };
  std::future<bool> f;
  {
    TaskRunner runner(1);
    std::atomic<bool> started{ false };
    f = runner.submit([&] {
      started = true;
      std::this_thread::sleep_for(30ms);
      finished = true;
    });
    while (!started) std::this_thread::yield();
  } // destructor stops
  EXPECT_TRUE(finished.load());
  EXPECT_TRUE(f.get());
}

TEST(UiTaskQueue, RunsPostedTasksOnPump)
{
  UiTaskQueue queue;
  std::vector<int> order;
  queue.post([&] { order.push_back(1); });
  queue.post([&] { order.push_back(2); });
  EXPECT_EQ(queue.pending(), 2u);
  EXPECT_TRUE(order.empty());

  EXPECT_EQ(queue.pump(), 2u);
  EXPECT_EQ(order, (std::vector<int>{ 1, 2 }));
  EXPECT_EQ(queue.pending(), 0u);
}

TEST(UiTaskQueue, TasksPostedWhilePumpingWaitForNextPump)
{
  UiTaskQueue queue;
  int runs = 0;
  queue.post([&] { ++runs; queue.post([&] { ++runs; }); });

  EXPECT_EQ(queue.pump(), 1u);
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(queue.pending(), 1u);
  EXPECT_EQ(queue.pump(), 1u);
  EXPECT_EQ(runs, 2);
}

TEST(UiTaskQueue, ThrowingTaskDoesNotStopTheRest)
{
  LogCapture log;
  UiTaskQueue queue;
  int runs = 0;
  queue.post([] { throw std::runtime_error("ui task"); });
  queue.post([&] { ++runs; });

  EXPECT_EQ(queue.pump(), 1u);
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(log.count(base::LogLevel::Error), 1u);
}

TEST(UiTaskQueue, WorkerPostsBackToUiThread)
{
  TaskRunner runner(2);
  UiTaskQueue queue;
  std::atomic<int> posted{ 0 };
  std::vector<std::future<bool>> jobs;
  for (int i = 0; i < 8; ++i)
    jobs.push_back(runner.submit([&] { queue.post([] {}); ++posted; }));
  for (auto& j : jobs) j.get();

  EXPECT_EQ(posted.load(), 8);
  EXPECT_EQ(queue.pump(), 8u);
}

TEST(RedrawPort, DeferredCoalescesRequests)
{
  DeferredRedrawPort port;
  EXPECT_FALSE(port.pending());
  port.requestRedraw();
  port.requestRedraw();
  EXPECT_TRUE(port.pending());
  EXPECT_EQ(port.requestCount(), 2u);

  EXPECT_TRUE(port.consume());
  EXPECT_FALSE(port.consume());
  EXPECT_FALSE(port.pending());
}

TEST(RedrawPort, ImmediateCallsThroughAndContainsThrows)
{
  LogCapture log;
  int calls = 0;
  ImmediateRedrawPort port([&] { ++calls; });
  port.requestRedraw();
  EXPECT_EQ(calls, 1);

  ImmediateRedrawPort broken([] { throw std::runtime_error("no window"); });
  EXPECT_NO_THROW(broken.requestRedraw());
  EXPECT_EQ(log.count(base::LogLevel::Error), 1u);

  ImmediateRedrawPort empty{ std::function<void()>() };
  EXPECT_NO_THROW(empty.requestRedraw());
}
