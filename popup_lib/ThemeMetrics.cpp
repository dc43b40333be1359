#include "ThemeMetrics.h"
#include "Utils.h"

namespace Popup_lib
{
  //------------------------------------------------------------------------
  ThemeMetrics::ThemeMetrics(PopupTheme theme)
    : m_theme(std::move(theme))
  {}

  //------------------------------------------------------------------------
  Vec4 ThemeMetrics::themeColor(const std::string& role) const
  {
    auto it = m_theme.colors.find(role);
    return it == m_theme.colors.end() ? fallbackColor() : it->second;
  }

  //------------------------------------------------------------------------
  Vec2 ThemeMetrics::measureText(std::string_view text, float fontSize) const
  {
    return Vec2{ m_theme.textAdvance * fontSize * static_cast<float>(utf8Length(text)), fontSize };
  }
}
