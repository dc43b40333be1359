#pragma once
#include "Popup.h"

#include <deque>
#include <memory>

namespace Popup_lib
{
  // Holds the one active popup plus a FIFO of popups waiting their turn.
  // Ownership is shared: a worker keeping a shared_ptr or weak_ptr to a popup may
  // still poll it or update its widgets after the session ended. UI thread only.
  class DLL_POPUP_LIB PopupManager
  {
  public:
    // Activates the popup, or queues it behind the active one. Returns false and drops
    // the popup when the context has no metrics, backend or drawable region.
    bool show(UiContext& ctx, std::shared_ptr<Popup> popup);
    // always queues, even when nothing is active
    Popup& queueNext(std::shared_ptr<Popup> popup);
    // finishes the active popup and activates the next queued one
    void closeActive(UiContext& ctx);

    // ends a finished/cancelled session, then renders the active popup
    void draw(UiContext& ctx);
    // Returns true when the host must not process the event further.
    bool handleEvent(UiContext& ctx, const UIEvent& e);

    Popup* active() const { return m_active.get(); }
    bool hasActive() const { return m_active != nullptr; }
    size_t queued() const { return m_queue.size(); }

  private:
    bool activate(UiContext& ctx, std::shared_ptr<Popup> popup);
    void activateNext(UiContext& ctx);
    void endSession(UiContext& ctx);
    bool sessionOver() const { return m_active && (m_active->finished || m_active->cancelled); }

    std::shared_ptr<Popup> m_active;
    std::deque<std::shared_ptr<Popup>> m_queue;
  };
}
