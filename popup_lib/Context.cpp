#include "Context.h"

namespace Popup_lib
{
  //------------------------------------------------------------------------
  float UiContext::uiScale() const
  {
    if (!metrics) return 1.f;
    const float s = metrics->uiScale();
    return s > 0.f ? s : 1.f;
  }

  //------------------------------------------------------------------------
  float UiContext::baseFontSize() const
  {
    return metrics ? metrics->baseFontSize() : 11.f;
  }

  //------------------------------------------------------------------------
  Vec4 UiContext::color(const std::string& role) const
  {
    return metrics ? metrics->themeColor(role) : fallbackColor();
  }

  //------------------------------------------------------------------------
  Vec2 UiContext::measureText(std::string_view text, float fontPx) const
  {
    return metrics ? metrics->measureText(text, fontPx) : Vec2{ 0.f, fontPx };
  }

  //------------------------------------------------------------------------
  float UiContext::fontPx(float fontSize, float mult) const
  {
    const float base = fontSize > 0.f ? fontSize : baseFontSize();
    return base * mult * uiScale();
  }

  //------------------------------------------------------------------------
  float UiContext::lineHeight(float fontPx) const
  {
    return measureText("Hg", fontPx).y * 1.5f;
  }

  //------------------------------------------------------------------------
  float UiContext::maxPopupHeight() const
  {
    return region.h > 0.f ? region.h * layout.maxHeightRatio : layout.fallbackMaxHeight;
  }

  //------------------------------------------------------------------------
  void UiContext::requestRedraw() const
  {
    if (redraw) redraw->requestRedraw();
  }
}
