#include "Scrollbar.h"

#include <algorithm>

#include "Utils.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  Scrollbar::Scrollbar(Orientation orientation_, float thickness)
    : Widget(0, 0, thickness, 100), orientation(orientation_)
  {
    if (orientation == Orientation::Horizontal) std::swap(width, height);
  }

  //----------------------------------------------------------------------------
  void Scrollbar::setScrollInfo(float offset, float max, float visibleSize)
  {
    const float track = trackLength();
    maxScroll = std::max(0.f, max);
    scrollOffset = clampLow(offset, 0.f, maxScroll);

    const float total = visibleSize + maxScroll;
    if (maxScroll > 0.f && total > 0.f) {
      thumbSize = std::min(track, std::max(minThumbSize, visibleSize / total * track));
      thumbPosition = scrollOffset / maxScroll * thumbRange();
    }
    else {
      thumbSize = track;
      thumbPosition = 0.f;
    }
  }

  //----------------------------------------------------------------------------
  Rect Scrollbar::thumbRect(const UiContext& ctx) const
  {
    const float s = ctx.uiScale();
    const Rect r = globalRect(ctx);
    if (orientation == Orientation::Vertical)
      return Rect{ r.x, r.y + thumbPosition * s, r.w, thumbSize * s };
    return Rect{ r.x + thumbPosition * s, r.y, thumbSize * s, r.h };
  }

  //----------------------------------------------------------------------------
  bool Scrollbar::isInsideThumb(const UiContext& ctx, const Vec2& p) const
  {
    return contains(thumbRect(ctx), p);
  }

  //----------------------------------------------------------------------------
  float Scrollbar::offsetForThumb(float thumbPos) const
  {
    const float range = thumbRange();
    return range > 0.f ? thumbPos / range * maxScroll : 0.f;
  }

  //----------------------------------------------------------------------------
  bool Scrollbar::scrollTo(float offset)
  {
    const float clamped = clampLow(offset, 0.f, maxScroll);
    scrollOffset = clamped;
    thumbPosition = maxScroll > 0.f ? clamped / maxScroll * thumbRange() : 0.f;
    if (!onScroll) return true;
    return invokeGuarded("scroll callback", [&] { onScroll(clamped); });
  }

  //----------------------------------------------------------------------------
  void Scrollbar::draw(UiContext& ctx) const
  {
    ctx.backend->drawRect(globalRect(ctx), ctx.color("scroll_track"));
    ctx.backend->drawRect(thumbRect(ctx), ctx.color(hover || isDragging ? "scroll_thumb_hover" : "scroll_thumb"));
  }

  //----------------------------------------------------------------------------
  bool Scrollbar::onEvent(UiContext& ctx, const UIEvent& e)
  {
    const PointerEvent* p = e.pointer();
    if (!p) return false;

    hover = isInside(ctx, p->pos);
    const float s = ctx.uiScale();
    const bool vertical = orientation == Orientation::Vertical;

    if (p->button == PointerButton::Left && p->type == PointerEvent::Type::Down) {
      if (isInsideThumb(ctx, p->pos)) {
        isDragging = true;
        dragStart = p->pos;
        dragStartOffset = scrollOffset;
        return true;
      }
      if (!hover) return false;
      // track click: centre the thumb under the pointer
      const float along = vertical ? (p->pos.y - globalY(ctx)) / s : (p->pos.x - globalX(ctx)) / s;
      const float thumb = clampLow(along - thumbSize * 0.5f, 0.f, thumbRange());
      return scrollTo(offsetForThumb(thumb));
    }

    if (p->button == PointerButton::Left && p->type == PointerEvent::Type::Up) {
      const bool wasDragging = isDragging;
      isDragging = false;
      return wasDragging;
    }

    if (p->type == PointerEvent::Type::Move && isDragging) {
      const float delta = vertical ? (p->pos.y - dragStart.y) / s : (p->pos.x - dragStart.x) / s;
      const float initThumb = maxScroll > 0.f ? dragStartOffset / maxScroll * thumbRange() : 0.f;
      const float thumb = clampLow(initThumb + delta, 0.f, thumbRange());
      return scrollTo(offsetForThumb(thumb));
    }
    return false;
  }
}
