#pragma once
#include "Widget.h"

#include <algorithm>

namespace Popup_lib
{
  enum class Orientation : uint8_t { Vertical, Horizontal };

  //-----------------------------------------------------------------------------------------------
  // Track + thumb. Offsets and sizes are logical units along the track; the thumb
  // starts at the top (vertical) or left (horizontal) edge.
  struct DLL_POPUP_LIB Scrollbar : public Widget
  {
    explicit Scrollbar(Orientation orientation = Orientation::Vertical, float thickness = 16.f);

    Orientation orientation;
    float scrollOffset = 0.f;   // 0..maxScroll
    float maxScroll = 0.f;
    float thumbSize = 40.f;
    float minThumbSize = 40.f;
    float thumbPosition = 0.f;  // 0..trackLength() - thumbSize
    bool  isDragging = false;
    Vec2  dragStart{};          // host px
    float dragStartOffset = 0.f;
    std::function<void(float)> onScroll; // receives the clamped new offset

    void setScrollInfo(float scrollOffset, float maxScroll, float visibleSize);
    float trackLength() const { return orientation == Orientation::Vertical ? height : width; }
    Rect thumbRect(const UiContext& ctx) const;
    bool isInsideThumb(const UiContext& ctx, const Vec2& p) const;

    void draw(UiContext& ctx) const override;
    bool onEvent(UiContext& ctx, const UIEvent& e) override;

  private:
    float offsetForThumb(float thumbPos) const;
    float thumbRange() const { return std::max(0.f, trackLength() - thumbSize); }
    bool scrollTo(float offset);
  };
}
