#pragma once
#include "base.h"

#include <string>
#include <unordered_map>

namespace Popup_lib
{
  // Logical (unscaled) layout constants; multiplied by uiScale when drawn.
  struct LayoutMetrics
  {
    float margin = 20.f;
    float padding = 10.f;
    float titleHeight = 45.f;
    float scrollbarWidth = 16.f;
    float minThumbSize = 40.f;
    float wheelStep = 20.f;
    float maxHeightRatio = 0.75f;   // of the region height
    float fallbackMaxHeight = 600.f;  // px, when the region has no height
    float defaultWidth = 400.f;
    float borderThickness = 2.f;

    float fontScale = 1.8f;         // base font -> widget text
    float progressFontScale = 1.5f;
    float buttonPadding = 12.f;
    float inputPadding = 10.f;
    float rowHeight = 30.f;
    float progressHeight = 30.f;
    float progressTextPadding = 10.f;
    float progressRedrawInterval = 0.2f; // seconds
  };

  struct PopupTheme
  {
    float uiScale = 1.f;
    float baseFontSize = 11.f;
    float textAdvance = 0.6f;  // fixed glyph advance, fraction of the font size
    std::unordered_map<std::string, Vec4> colors; // role -> rgba
    LayoutMetrics layout;
  };

  inline Vec4 fallbackColor() { return Vec4{ 0.2f, 0.2f, 0.2f, 1.f }; }

  DLL_POPUP_LIB PopupTheme defaultTheme();
}
