#pragma once
#include "popup_lib.h"

#include <functional>
#include <mutex>
#include <vector>

#include "Utils.h"

namespace Popup_lib
{
  // "Run this on the UI thread": post from any thread, pump once per frame on the UI thread.
  struct UiTaskQueue
  {
    using Task = std::function<void()>;

    // Post from ANY thread: enqueues only
    void post(Task t) {
      std::lock_guard<std::mutex> lk(qmtx);
      queue.push_back(std::move(t));
    }

    // Pump on UI thread; tasks posted while pumping run on the next pump.
    // Returns the number of tasks that ran without throwing.
    size_t pump() {
      std::vector<Task> local;
      {
        std::lock_guard<std::mutex> lk(qmtx);
        local.swap(queue);
      }
      size_t ok = 0;
      for (auto& t : local)
        if (invokeGuarded("ui task", t)) ++ok;
      return ok;
    }

    size_t pending() const {
      std::lock_guard<std::mutex> lk(qmtx);
      return queue.size();
    }

  private:
    mutable std::mutex qmtx;
    std::vector<Task> queue;
  };
}
