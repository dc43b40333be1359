#include "TaskRunner.h"

#include <algorithm>
#include <exception>

#include <base/Log.h>

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  TaskRunner::TaskRunner(size_t workers)
    : m_workerCount(workers)
  {
    if (m_workerCount == 0) m_workerCount = std::max(1u, std::thread::hardware_concurrency());
  }

  //----------------------------------------------------------------------------
  TaskRunner::~TaskRunner()
  {
    stop();
  }

  //----------------------------------------------------------------------------
  void TaskRunner::start()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    startLocked();
  }

  //----------------------------------------------------------------------------
  void TaskRunner::startLocked()
  {
    if (m_shutdown || !m_workers.empty()) return;
    for (size_t i = 0; i < m_workerCount; ++i)
      m_workers.emplace_back(&TaskRunner::workerLoop, this);
  }

  //----------------------------------------------------------------------------
  void TaskRunner::stop()
  {
    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_shutdown = true;
      for (Job& j : m_jobs) j.done.set_value(false);
      m_jobs.clear();
      workers.swap(m_workers);
    }
    m_cv.notify_all();
    for (std::thread& t : workers)
      if (t.joinable()) t.join();
  }

  //----------------------------------------------------------------------------
  std::future<bool> TaskRunner::submit(std::function<void()> job)
  {
    std::future<bool> f;
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      if (m_shutdown) {
        std::promise<bool> rejected;
        rejected.set_value(false);
        return rejected.get_future();
      }
      startLocked();
      m_jobs.push_back(Job{ std::move(job), std::promise<bool>() });
      f = m_jobs.back().done.get_future();
    }
    m_cv.notify_one();
    return f;
  }

  //----------------------------------------------------------------------------
  void TaskRunner::pause()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_paused = true;
  }

  //----------------------------------------------------------------------------
  void TaskRunner::resume()
  {
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_paused = false;
    }
    m_cv.notify_all();
  }

  //----------------------------------------------------------------------------
  size_t TaskRunner::cancelAll()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    const size_t n = m_jobs.size();
    for (Job& j : m_jobs) j.done.set_value(false);
    m_jobs.clear();
    return n;
  }

  //----------------------------------------------------------------------------
  bool TaskRunner::isPaused() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_paused;
  }

  //----------------------------------------------------------------------------
  bool TaskRunner::isRunning() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return !m_workers.empty() && !m_shutdown;
  }

  //----------------------------------------------------------------------------
  size_t TaskRunner::pendingCount() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_jobs.size();
  }

  //----------------------------------------------------------------------------
  void TaskRunner::workerLoop()
  {
    while (true) {
      Job job;
      {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv.wait(lk, [this] { return m_shutdown || (!m_paused && !m_jobs.empty()); });
        if (m_shutdown) return;
        job = std::move(m_jobs.front());
        m_jobs.pop_front();
      }

      bool ok = true;
      try {
        job.fn();
      }
      catch (const std::exception& e) {
        base::LogError("background task failed: %s", e.what());
        ok = false;
      }
      job.done.set_value(ok);
    }
  }
}
