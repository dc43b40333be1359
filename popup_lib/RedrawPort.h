#pragma once
#include "Interfaces.h"

#include <atomic>
#include <functional>

namespace Popup_lib
{
  // Redraws on the calling thread; for hosts whose redraw call is itself thread-safe
  // or that only ever update from the UI thread.
  class DLL_POPUP_LIB ImmediateRedrawPort : public IRedrawPort
  {
  public:
    explicit ImmediateRedrawPort(std::function<void()> redraw) : m_redraw(std::move(redraw)) {}
    void requestRedraw() override;

  private:
    std::function<void()> m_redraw;
  };

  // Coalesces requests from any thread into one flag the UI thread consumes per frame.
  class DLL_POPUP_LIB DeferredRedrawPort : public IRedrawPort
  {
  public:
    void requestRedraw() override;
    bool pending() const { return m_pending.load(); }
    // true once per burst of requests
    bool consume() { return m_pending.exchange(false); }
    size_t requestCount() const { return m_requests.load(); }

  private:
    std::atomic<bool> m_pending{ false };
    std::atomic<size_t> m_requests{ 0 };
  };
}
