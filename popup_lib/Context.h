#pragma once
#include "popup_lib.h"

#include <string>
#include <string_view>

#include "Interfaces.h"
#include "Theme.h"

namespace Popup_lib
{
  // Everything a popup needs from the host for one layout/draw/event pass.
  // Pointers are not owned and must outlive the popups using this context.
  // The context itself may be rebuilt per frame, popups only keep the redraw port.
  struct DLL_POPUP_LIB UiContext
  {
    IMetricsProvider* metrics = nullptr;
    IDrawBackend*     backend = nullptr;
    IRedrawPort*      redraw = nullptr;

    Rect region{};  // drawable region, host px
    Rect window{};  // drag bounds; empty means region
    LayoutMetrics layout;

    bool valid() const { return metrics && backend && !isEmpty(region); }

    float uiScale() const;
    float baseFontSize() const;
    Vec4  color(const std::string& role) const;
    Vec2  measureText(std::string_view text, float fontPx) const;

    // fontSize * mult * uiScale, fontSize <= 0 means the theme base size
    float fontPx(float fontSize, float mult) const;
    // height of "Hg" * 1.5
    float lineHeight(float fontPx) const;

    float maxPopupHeight() const;
    Rect  dragBounds() const { return isEmpty(window) ? region : window; }

    void requestRedraw() const;
  };
}
