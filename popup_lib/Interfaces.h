#pragma once
#include "base.h"

#include <string>
#include <string_view>

namespace Popup_lib
{
  // Host-supplied scale, font and colour information.
  struct DLL_POPUP_LIB IMetricsProvider
  {
    virtual ~IMetricsProvider() = default;

    virtual float uiScale() const = 0;
    virtual float baseFontSize() const = 0;
    // unknown roles return a neutral grey
    virtual Vec4 themeColor(const std::string& role) const = 0;
    // width/height in pixels of a single line at fontSize pixels
    virtual Vec2 measureText(std::string_view text, float fontSize) const = 0;
  };

  // Immediate-mode drawing; all coordinates in host pixels.
  struct DLL_POPUP_LIB IDrawBackend
  {
    virtual ~IDrawBackend() = default;

    virtual void drawRect(const Rect& r, const Vec4& color) = 0;
    virtual void drawRectBorder(const Rect& r, const Vec4& color, float thickness) = 0;
    virtual void pushClip(const Rect& r) = 0;
    virtual void popClip() = 0;
    // pos is the top-left of the text line
    virtual void drawText(std::string_view text, const Vec2& pos, float fontSize, const Vec4& color) = 0;
  };

  // Safe to call from any thread.
  struct DLL_POPUP_LIB IRedrawPort
  {
    virtual ~IRedrawPort() = default;
    virtual void requestRedraw() = 0;
  };
}
