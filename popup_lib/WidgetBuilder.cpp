#include "WidgetBuilder.h"

#include "ProgressBar.h"
#include "TextInput.h"
#include "Widget.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  WidgetBuilder& WidgetBuilder::label(const std::string& text)
  {
    m_parent.addChild(std::make_unique<Label>(text));
    return *this;
  }

  //----------------------------------------------------------------------------
  WidgetBuilder& WidgetBuilder::button(const std::string& text, std::function<void()> callback)
  {
    m_parent.addChild(std::make_unique<Button>(text, std::move(callback)));
    return *this;
  }

  //----------------------------------------------------------------------------
  TextInput& WidgetBuilder::textInput(const std::string& text)
  {
    return m_parent.addChild(std::make_unique<TextInput>(text));
  }

  //----------------------------------------------------------------------------
  ProgressBar& WidgetBuilder::progressBar(float current, float maxValue, const std::string& text)
  {
    return m_parent.addChild(std::make_unique<ProgressBar>(current, maxValue, text));
  }

  //----------------------------------------------------------------------------
  Row& WidgetBuilder::row()
  {
    return m_parent.addChild(std::make_unique<Row>());
  }
}
