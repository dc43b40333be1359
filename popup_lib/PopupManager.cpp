#include "PopupManager.h"

#include <base/Log.h>

#include "Utils.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  bool PopupManager::show(UiContext& ctx, std::shared_ptr<Popup> popup)
  {
    if (!popup) return false;
    if (!ctx.valid()) {
      base::LogError("cannot show popup '%s': no drawable region", popup->title.c_str());
      return false;
    }
    if (m_active) {
      queueNext(std::move(popup));
      return true;
    }
    return activate(ctx, std::move(popup));
  }

  //----------------------------------------------------------------------------
  Popup& PopupManager::queueNext(std::shared_ptr<Popup> popup)
  {
    popup->shown = true;
    base::Log("popup '%s' queued (%zu waiting)", popup->title.c_str(), m_queue.size() + 1);
    m_queue.push_back(std::move(popup));
    return *m_queue.back();
  }

  //----------------------------------------------------------------------------
  bool PopupManager::activate(UiContext& ctx, std::shared_ptr<Popup> popup)
  {
    popup->shown = true;
    popup->updateLayout(ctx);
    m_active = std::move(popup);
    ctx.requestRedraw();
    return true;
  }

  //----------------------------------------------------------------------------
  void PopupManager::endSession(UiContext& ctx)
  {
    std::shared_ptr<Popup> done = std::move(m_active);
    base::Log("popup '%s' closed (%s)", done->title.c_str(), done->cancelled ? "cancelled" : "finished");
    if (done->onClosed) invokeGuarded("popup close observer", [&] { done->onClosed(*done); });
    // late updates from workers still holding the popup no longer reach the host
    done->setRedrawPort(nullptr);
    done.reset();

    activateNext(ctx);
    ctx.requestRedraw();
  }

  //----------------------------------------------------------------------------
  void PopupManager::activateNext(UiContext& ctx)
  {
    // the context may have lost its region meanwhile, keep waiting then
    if (m_active || m_queue.empty() || !ctx.valid()) return;
    std::shared_ptr<Popup> next = std::move(m_queue.front());
    m_queue.pop_front();
    activate(ctx, std::move(next));
  }

  //----------------------------------------------------------------------------
  void PopupManager::closeActive(UiContext& ctx)
  {
    if (!m_active) return;
    m_active->finished = true;
    endSession(ctx);
  }

  //----------------------------------------------------------------------------
  void PopupManager::draw(UiContext& ctx)
  {
    if (sessionOver()) endSession(ctx);
    else if (!m_active) activateNext(ctx);
    if (m_active) m_active->render(ctx);
  }

  //----------------------------------------------------------------------------
  bool PopupManager::handleEvent(UiContext& ctx, const UIEvent& e)
  {
    if (!m_active) return false;

    const PointerEvent* p = e.pointer();
    const bool isMove = p && p->type == PointerEvent::Type::Move;

    const bool handled = m_active->onEvent(ctx, e);
    if (sessionOver()) {
      endSession(ctx);
      return !isMove;
    }
    if (handled) ctx.requestRedraw();

    if (isMove) return false;
    if (handled) return true;

    if (p && !m_active->blocking) {
      // let the host keep navigating its scene
      if (p->type == PointerEvent::Type::Scroll) return false;
      if (p->type == PointerEvent::Type::Down) {
        if (p->button == PointerButton::Middle) return false;
        if ((p->button == PointerButton::Left || p->button == PointerButton::Right) &&
            !m_active->isInside(ctx, p->pos))
          return false;
      }
    }
    return true;
  }
}
