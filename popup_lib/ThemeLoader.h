#pragma once
#include "Theme.h"

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace Popup_lib
{
  inline Vec4 unpackRGBA(uint32_t v)
  {
    return Vec4{ ((v >> 24) & 0xFFu) / 255.f, ((v >> 16) & 0xFFu) / 255.f,
                 ((v >> 8) & 0xFFu) / 255.f, (v & 0xFFu) / 255.f };
  }

  // false when the node is not a number
  inline bool tryReadFloat(const YAML::Node& n, float& out)
  {
    return n.IsScalar() && YAML::convert<float>::decode(n, out);
  }

  // "#RRGGBB", "#RRGGBBAA", "0xRRGGBBAA" or [r, g, b(, a)] in 0..1
  inline std::optional<Vec4> parseColorNode(const YAML::Node& n)
  {
    if (!n) return std::nullopt;

    if (n.IsSequence()) {
      if (n.size() < 3 || n.size() > 4) return std::nullopt;
      Vec4 c{ 0.f, 0.f, 0.f, 1.f };
      for (size_t i = 0; i < n.size(); ++i)
        if (!tryReadFloat(n[i], c[static_cast<glm::length_t>(i)])) return std::nullopt;
      return c;
    }
    if (!n.IsScalar()) return std::nullopt;

    std::string t = n.as<std::string>();
    size_t a = t.find_first_not_of(" \t\r\n");
    size_t b = t.find_last_not_of(" \t\r\n");
    t = (a == std::string::npos) ? std::string() : t.substr(a, b - a + 1);

    std::string hex;
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) hex = t.substr(2);
    else if (t.size() > 1 && t[0] == '#') hex = t.substr(1);
    else return std::nullopt;

    if (hex.size() != 6 && hex.size() != 8) return std::nullopt;
    if (hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) return std::nullopt;

    uint32_t v = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    if (hex.size() == 6) v = (v << 8) | 0xFFu; // add alpha
    return unpackRGBA(v);
  }

  // Both return false (theme untouched) on unreadable input; errors are logged.
  DLL_POPUP_LIB bool loadThemeYaml(const std::string& path, PopupTheme& t);
  DLL_POPUP_LIB bool loadThemeYamlString(const std::string& yaml, PopupTheme& t);
}
