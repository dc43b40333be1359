#include "ThemeLoader.h"

#include <base/Log.h>

namespace Popup_lib
{
  namespace {
    void readFloat(const YAML::Node& n, const char* key, float& out) {
      if (n[key]) out = n[key].as<float>();
    }

    void applyTheme(const YAML::Node& y, PopupTheme& t) {
      readFloat(y, "uiScale", t.uiScale);
      readFloat(y, "baseFontSize", t.baseFontSize);
      readFloat(y, "textAdvance", t.textAdvance);

      if (auto l = y["layout"]) {
        LayoutMetrics& m = t.layout;
        readFloat(l, "margin", m.margin);
        readFloat(l, "padding", m.padding);
        readFloat(l, "titleHeight", m.titleHeight);
        readFloat(l, "scrollbarWidth", m.scrollbarWidth);
        readFloat(l, "minThumbSize", m.minThumbSize);
        readFloat(l, "wheelStep", m.wheelStep);
        readFloat(l, "maxHeightRatio", m.maxHeightRatio);
        readFloat(l, "fallbackMaxHeight", m.fallbackMaxHeight);
        readFloat(l, "defaultWidth", m.defaultWidth);
        readFloat(l, "borderThickness", m.borderThickness);
        readFloat(l, "fontScale", m.fontScale);
        readFloat(l, "progressFontScale", m.progressFontScale);
        readFloat(l, "buttonPadding", m.buttonPadding);
        readFloat(l, "inputPadding", m.inputPadding);
        readFloat(l, "rowHeight", m.rowHeight);
        readFloat(l, "progressHeight", m.progressHeight);
        readFloat(l, "progressTextPadding", m.progressTextPadding);
        readFloat(l, "progressRedrawInterval", m.progressRedrawInterval);
      }

      if (auto c = y["colors"]) {
        for (auto it : c) {
          const std::string role = it.first.as<std::string>();
          if (auto col = parseColorNode(it.second)) t.colors[role] = *col;
          else base::LogWarning("theme: unreadable color for role '%s', keeping previous", role.c_str());
        }
      }

      if (t.uiScale <= 0.f) {
        base::LogWarning("theme: uiScale %f is not positive, using 1", t.uiScale);
        t.uiScale = 1.f;
      }
    }

    template<class LoadFn>
    bool loadInto(const std::string& what, PopupTheme& t, LoadFn load) {
      PopupTheme parsed = t;
      try {
        const YAML::Node root = load();
        if (!root.IsNull() && !root.IsMap()) {
          base::LogError("theme '%s': top level is not a mapping", what.c_str());
          return false;
        }
        applyTheme(root, parsed);
      }
      catch (const YAML::BadFile& e) {
        base::LogError("YAML BadFile in '%s': %s", what.c_str(), e.what());
        return false;
      }
      catch (const YAML::ParserException& e) {
        base::LogError("YAML ParserException in '%s': %s", what.c_str(), e.what());
        return false;
      }
      catch (const YAML::BadConversion& e) {
        base::LogError("YAML BadConversion in '%s': %s", what.c_str(), e.what());
        return false;
      }
      catch (const YAML::Exception& e) {
        base::LogError("YAML error in '%s': %s", what.c_str(), e.what());
        return false;
      }
      t = std::move(parsed);
      return true;
    }
  }

  //------------------------------------------------------------------------
  bool loadThemeYaml(const std::string& path, PopupTheme& t)
  {
    return loadInto(path, t, [&path] { return YAML::LoadFile(path); });
  }

  //------------------------------------------------------------------------
  bool loadThemeYamlString(const std::string& yaml, PopupTheme& t)
  {
    return loadInto("<string>", t, [&yaml] { return YAML::Load(yaml); });
  }
}
