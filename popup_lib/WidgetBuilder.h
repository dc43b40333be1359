#pragma once
#include "popup_lib.h"

#include <functional>
#include <string>

namespace Popup_lib
{
  struct Widget;
  struct Row;
  struct TextInput;
  struct ProgressBar;

  // Appends widgets to a container. label/button chain, the rest return the new widget.
  class DLL_POPUP_LIB WidgetBuilder
  {
  public:
    explicit WidgetBuilder(Widget& parent) : m_parent(parent) {}

    WidgetBuilder& label(const std::string& text);
    WidgetBuilder& button(const std::string& text, std::function<void()> callback = {});
    TextInput& textInput(const std::string& text = {});
    ProgressBar& progressBar(float current = 0.f, float maxValue = 100.f, const std::string& text = {});
    Row& row();

  private:
    Widget& m_parent;
  };
}
