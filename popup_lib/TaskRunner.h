#pragma once
#include "popup_lib.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace Popup_lib
{
  // Fixed pool of worker threads for long-running jobs that report back through
  // ProgressBar/Label updates. Each job's future yields true when it ran to the end,
  // false when it threw or was cancelled before starting.
  class DLL_POPUP_LIB TaskRunner
  {
  public:
    // 0 workers: one per hardware thread
    explicit TaskRunner(size_t workers = 0);
    ~TaskRunner();
    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // no-op once stopped
    void start();
    // Cancels queued jobs and joins the workers once running jobs return.
    // A stopped runner stays stopped.
    void stop();

    // starts the pool on first use; after stop() the future is already false
    std::future<bool> submit(std::function<void()> job);

    // queued jobs wait, running jobs continue
    void pause();
    void resume();
    // resolves every queued job's future with false
    size_t cancelAll();

    bool isPaused() const;
    bool isRunning() const;
    size_t pendingCount() const;
    size_t workerCount() const { return m_workerCount; }

  private:
    struct Job
    {
      std::function<void()> fn;
      std::promise<bool> done;
    };

    void startLocked();
    void workerLoop();

    size_t m_workerCount;
    std::vector<std::thread> m_workers;
    std::deque<Job> m_jobs;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_paused = false;
    bool m_shutdown = false;
  };
}
