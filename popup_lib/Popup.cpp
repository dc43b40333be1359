#include "Popup.h"

#include <algorithm>

#include <base/Log.h>

#include "TextInput.h"
#include "Utils.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  Popup::Popup(std::string title_, std::string label, std::optional<float> w, std::optional<float> h,
               bool preventClose, bool blocking_)
    : Widget(0, 0, w.value_or(400.f), h.value_or(300.f))
    , title(std::move(title_))
    , blocking(blocking_)
    , m_autoWidth(!w)
    , m_autoHeight(!h)
    , m_preventClose(preventClose)
  {
    if (!label.empty()) addChild(std::make_unique<Label>(std::move(label)));
  }

  //----------------------------------------------------------------------------
  void Popup::setPreventClose(bool value)
  {
    if (m_preventClose == value) return;
    m_preventClose = value;
    m_needsFullLayout = true;
    requestRedraw();
  }

  //----------------------------------------------------------------------------
  WidgetBuilder Popup::add()
  {
    return WidgetBuilder(*this);
  }

  //----------------------------------------------------------------------------
  Button& Popup::addCloseButton(const std::string& text)
  {
    auto close = [this] { finished = true; };
    Button& b = addChild(std::make_unique<Button>(text, close));
    if (!onEnter) onEnter = close;
    markLayoutDirty();
    requestRedraw();
    return b;
  }

  //----------------------------------------------------------------------------
  bool Popup::hasButton() const
  {
    for (const auto& c : children) {
      if (c->asButton()) return true;
      if (Row* row = c->asRow())
        for (const auto& rc : row->children)
          if (rc->asButton()) return true;
    }
    return false;
  }

  //----------------------------------------------------------------------------
  void Popup::ensureDefaultButton()
  {
    if (m_preventClose || hasButton()) return;
    auto close = [this] { finished = true; };
    addChild(std::make_unique<Button>("OK", close));
    if (!onEnter) onEnter = close;
  }

  //----------------------------------------------------------------------------
  float Popup::measureChildren(UiContext& ctx, float contentWidth)
  {
    float total = 0.f;
    for (size_t i = 0; i < children.size(); ++i) {
      Widget& c = *children[i];
      c.width = contentWidth;
      c.updateLayoutCustom(ctx, contentWidth);
      total += c.height;
      if (i + 1 < children.size()) total += ctx.layout.padding;
    }
    return total;
  }

  //----------------------------------------------------------------------------
  void Popup::layoutChildren(UiContext& ctx)
  {
    m_redraw = ctx.redraw;
    const LayoutMetrics& L = ctx.layout;
    const float s = ctx.uiScale();
    const float oldScaledH = scaledHeight(ctx);

    if (m_autoWidth) width = L.defaultWidth;

    float contentWidth = width - 2.f * L.margin;
    float childrenH = measureChildren(ctx, contentWidth);
    const float total = L.titleHeight + L.padding + childrenH + L.margin;
    const float maxPx = ctx.maxPopupHeight();

    isScrollable = total * s > maxPx;
    if (isScrollable) {
      height = maxPx / s;
      visibleContentHeight = height - L.titleHeight;

      // rewrap against the width left beside the scrollbar
      contentWidth = width - L.scrollbarWidth - 2.f * L.margin;
      childrenH = measureChildren(ctx, contentWidth);
      contentHeight = L.padding + childrenH + L.margin;
      maxScroll = std::max(0.f, contentHeight - visibleContentHeight);
      scrollOffset = clampLow(scrollOffset, 0.f, maxScroll);

      if (!m_scrollbar) {
        m_scrollbar = std::make_unique<Scrollbar>(Orientation::Vertical, L.scrollbarWidth);
        m_scrollbar->parent = this;
        m_scrollbar->onScroll = [this](float offset) { scrollTo(offset); };
      }
      m_scrollbar->minThumbSize = L.minThumbSize;
      m_scrollbar->width = L.scrollbarWidth;
      m_scrollbar->height = visibleContentHeight;
      m_scrollbar->x = width - L.scrollbarWidth;
      m_scrollbar->y = 0.f;
      m_scrollbar->setScrollInfo(scrollOffset, maxScroll, visibleContentHeight);
    }
    else {
      if (m_autoHeight) height = total;
      contentHeight = L.padding + childrenH + L.margin;
      visibleContentHeight = height - L.titleHeight;
      scrollOffset = 0.f;
      maxScroll = 0.f;
      m_scrollbar.reset();
    }

    // keep the old midpoint when the height moved
    if (m_laidOut && m_autoHeight && scaledHeight(ctx) != oldScaledH) {
      const float centerY = y + oldScaledH * 0.5f;
      const float newH = scaledHeight(ctx);
      y = clampLow(centerY - newH * 0.5f, ctx.region.y, ctx.region.y + ctx.region.h - newH);
    }

    float cy = L.padding;
    for (auto& c : children) {
      c->x = L.margin;
      c->y = cy;
      c->width = contentWidth;
      cy += c->height + L.padding;
    }
  }

  //----------------------------------------------------------------------------
  void Popup::updateLayout(UiContext& ctx)
  {
    m_redraw = ctx.redraw;
    m_needsFullLayout = false;
    m_needsRelayout = false;

    ensureDefaultButton();
    layoutChildren(ctx);

    const Rect& r = ctx.region;
    x = r.x + (r.w - scaledWidth(ctx)) * 0.5f;
    y = r.y + (r.h - scaledHeight(ctx)) * 0.5f;
    m_laidOut = true;
  }

  //----------------------------------------------------------------------------
  void Popup::render(UiContext& ctx)
  {
    m_redraw = ctx.redraw;
    if (!m_laidOut) {
      updateLayout(ctx);
    }
    else if (m_needsFullLayout.exchange(false)) {
      m_needsRelayout = false;
      ensureDefaultButton();
      layoutChildren(ctx);
    }
    else if (m_needsRelayout.exchange(false)) {
      layoutChildren(ctx);
    }
    draw(ctx);
  }

  //----------------------------------------------------------------------------
  Vec2 Popup::childOrigin(const UiContext& ctx, const Widget& child) const
  {
    const float s = ctx.uiScale();
    const float top = y + ctx.layout.titleHeight * s;
    if (&child == m_scrollbar.get()) return Vec2{ x, top };
    return Vec2{ x, top - scrollOffset * s };
  }

  //----------------------------------------------------------------------------
  Rect Popup::titleBar(const UiContext& ctx) const
  {
    return Rect{ x, y, scaledWidth(ctx), ctx.layout.titleHeight * ctx.uiScale() };
  }

  //----------------------------------------------------------------------------
  Rect Popup::contentClip(const UiContext& ctx) const
  {
    const float s = ctx.uiScale();
    const float titleH = ctx.layout.titleHeight * s;
    const float w = isScrollable ? (width - ctx.layout.scrollbarWidth) * s : scaledWidth(ctx);
    return Rect{ x, y + titleH, std::max(0.f, w), std::max(0.f, scaledHeight(ctx) - titleH) };
  }

  //----------------------------------------------------------------------------
  void Popup::scrollTo(float offset)
  {
    scrollOffset = clampLow(offset, 0.f, maxScroll);
    if (m_scrollbar) m_scrollbar->setScrollInfo(scrollOffset, maxScroll, visibleContentHeight);
  }

  //----------------------------------------------------------------------------
  void Popup::requestRedraw() const
  {
    if (IRedrawPort* port = m_redraw.load()) port->requestRedraw();
  }

  //----------------------------------------------------------------------------
  void Popup::draw(UiContext& ctx) const
  {
    IDrawBackend& b = *ctx.backend;
    const LayoutMetrics& L = ctx.layout;
    const float s = ctx.uiScale();
    const Rect r = globalRect(ctx);

    b.drawRect(r, ctx.color("popup_bg"));
    b.drawRectBorder(r, ctx.color("popup_border"), L.borderThickness * s);

    const Rect bar = titleBar(ctx);
    b.drawRect(bar, ctx.color("header_bg"));
    const float px = ctx.fontPx(0.f, L.fontScale);
    const Vec2 ext = ctx.measureText(title, px);
    b.pushClip(bar);
    b.drawText(title, { r.x + L.margin * s, r.y + (bar.h - ext.y) * 0.5f }, px, ctx.color("title_text"));
    b.popClip();

    if (isScrollable) b.pushClip(contentClip(ctx));
    for (const auto& c : children) c->draw(ctx);
    if (isScrollable) b.popClip();

    if (m_scrollbar) m_scrollbar->draw(ctx);
  }

  //----------------------------------------------------------------------------
  void Popup::updateHover(const UiContext& ctx, const Vec2& p)
  {
    const bool inContent = !isScrollable || contains(contentClip(ctx), p);
    for (auto& c : children) c->hover = inContent && c->isInside(ctx, p);
    if (m_scrollbar) m_scrollbar->hover = m_scrollbar->isInside(ctx, p);
  }

  //----------------------------------------------------------------------------
  void Popup::blurInputsOutside(const UiContext& ctx, const Vec2& p)
  {
    const bool inContent = !isScrollable || contains(contentClip(ctx), p);
    std::function<void(Widget&)> visit = [&](Widget& w) {
      if (TextInput* input = w.asTextInput()) {
        if (!(inContent && input->isInside(ctx, p))) input->blur();
      }
      else if (Row* row = w.asRow()) {
        for (auto& c : row->children) visit(*c);
      }
    };
    for (auto& c : children) visit(*c);
  }

  //----------------------------------------------------------------------------
  bool Popup::onEvent(UiContext& ctx, const UIEvent& e)
  {
    const PointerEvent* p = e.pointer();
    if (p) m_lastPointer = p->pos;
    if (m_lastPointer) updateHover(ctx, *m_lastPointer);

    if (p) {
      const float s = ctx.uiScale();

      if (p->type == PointerEvent::Type::Scroll) {
        if (!isScrollable || !isInside(ctx, p->pos)) return false;
        scrollTo(scrollOffset - p->wheel * ctx.layout.wheelStep);
        return true;
      }

      if (p->type == PointerEvent::Type::Down && p->button == PointerButton::Left)
        blurInputsOutside(ctx, p->pos);

      if (p->type == PointerEvent::Type::Down && p->button == PointerButton::Left &&
          contains(titleBar(ctx), p->pos)) {
        isDragging = true;
        dragOffset = p->pos - Vec2{ x, y };
        return true;
      }
      if (isDragging) {
        if (p->type == PointerEvent::Type::Up && p->button == PointerButton::Left) {
          isDragging = false;
          return true;
        }
        if (p->type == PointerEvent::Type::Move) {
          const Rect bounds = ctx.dragBounds();
          x = clampLow(p->pos.x - dragOffset.x, bounds.x, bounds.x + bounds.w - width * s);
          y = clampLow(p->pos.y - dragOffset.y, bounds.y, bounds.y + bounds.h - height * s);
          return true;
        }
      }

      if (m_scrollbar && m_scrollbar->onEvent(ctx, e)) return true;
    }

    // last added gets first refusal
    for (auto it = children.rbegin(); it != children.rend(); ++it)
      if ((*it)->onEvent(ctx, e)) return true;

    if (p) {
      // clicks inside the popup never reach the host scene
      return p->type == PointerEvent::Type::Down && isInside(ctx, p->pos);
    }
    if (const KeyEvent* k = e.key()) return onKey(*k);
    return false;
  }

  //----------------------------------------------------------------------------
  bool Popup::onKey(const KeyEvent& k)
  {
    if (k.type != KeyEvent::Type::KeyDown) return false;

    if (k.key == Key::Enter) {
      if (m_preventClose) return true;
      if (!onEnter) return false;
      return invokeGuarded("popup enter action", onEnter);
    }
    if (k.key == Key::Escape) {
      if (m_preventClose) return true;
      if (onCancel) return invokeGuarded("popup cancel action", onCancel);
      cancelled = true;
      base::Log("popup '%s' cancelled", title.c_str());
      return true;
    }
    return false;
  }
}
