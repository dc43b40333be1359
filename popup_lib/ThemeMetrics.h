#pragma once
#include "Interfaces.h"
#include "Theme.h"

namespace Popup_lib
{
  // Metrics from a PopupTheme with a fixed-advance text measurer:
  // width = textAdvance * fontSize per code point, height = fontSize.
  class DLL_POPUP_LIB ThemeMetrics : public IMetricsProvider
  {
  public:
    explicit ThemeMetrics(PopupTheme theme = defaultTheme());

    float uiScale() const override { return m_theme.uiScale; }
    float baseFontSize() const override { return m_theme.baseFontSize; }
    Vec4 themeColor(const std::string& role) const override;
    Vec2 measureText(std::string_view text, float fontSize) const override;

    const PopupTheme& theme() const { return m_theme; }
    void setTheme(PopupTheme theme) { m_theme = std::move(theme); }

  private:
    PopupTheme m_theme;
  };
}
