#pragma once
#include "popup_lib.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Context.h"

namespace Popup_lib
{
  struct Button;
  struct Row;
  struct TextInput;
  class Popup;
  class WidgetBuilder;

  //-----------------------------------------------------------------------------------------------
  struct DLL_POPUP_LIB Widget
  {
    float x = 0, y = 0;              // logical, relative to the parent's child origin (root: host px)
    float width = 100, height = 20;  // logical
    bool hover = false;
    bool focused = false;
    std::vector<std::unique_ptr<Widget>> children;
    Widget* parent = nullptr;        // not owned

    // Widgets live in the tree behind unique_ptr and hand out `this` to callbacks: no copy, no move.
    Widget() = default;
    Widget(float x, float y, float width, float height);
    Widget(const Widget&) = delete;
    Widget& operator=(const Widget&) = delete;
    virtual ~Widget() = default;

    float scaledWidth(const UiContext& ctx) const { return width * ctx.uiScale(); }
    float scaledHeight(const UiContext& ctx) const { return height * ctx.uiScale(); }
    float globalX(const UiContext& ctx) const;
    float globalY(const UiContext& ctx) const;
    Rect  globalRect(const UiContext& ctx) const;
    // inclusive on all four edges
    bool  isInside(const UiContext& ctx, const Vec2& p) const;

    // host px position that a child's (0,0) maps to
    virtual Vec2 childOrigin(const UiContext& ctx, const Widget& child) const;

    virtual void updateLayout(UiContext& ctx) { (void)ctx; }
    // measure against availableWidth (logical) and settle height
    virtual void updateLayoutCustom(UiContext& ctx, float availableWidth) { (void)availableWidth; updateLayout(ctx); }
    virtual void draw(UiContext& ctx) const { (void)ctx; }
    // return true if consumed
    virtual bool onEvent(UiContext& ctx, const UIEvent& e) { (void)ctx; (void)e; return false; }

    virtual Button*    asButton() { return nullptr; }
    virtual Row*       asRow() { return nullptr; }
    virtual TextInput* asTextInput() { return nullptr; }
    virtual Popup*     asPopup() { return nullptr; }

    // nearest Popup on the ancestor chain, this included
    Popup* owningPopup();

    template<class T>
    T& addChild(std::unique_ptr<T> w)
    {
      w->parent = this;
      T& ref = *w;
      children.emplace_back(std::move(w));
      return ref;
    }
  };

  //-----------------------------------------------------------------------------------------------
  struct DLL_POPUP_LIB Label : public Widget
  {
    explicit Label(std::string text, float fontSize = 0.f, std::optional<Vec4> color = std::nullopt);

    float fontSize = 0.f;            // <= 0: theme base size
    std::optional<Vec4> color;       // unset: theme "text"
    std::vector<std::string> lines;  // wrapped against the last available width
    float lineHeight = 0.f;          // px

    std::string text() const;
    // Safe from any thread. The owning popup rewraps on its next render.
    void update(std::string text);

    void updateLayoutCustom(UiContext& ctx, float availableWidth) override;
    void draw(UiContext& ctx) const override;

  private:
    mutable std::mutex m_textMutex;
    std::string m_text;
  };

  //-----------------------------------------------------------------------------------------------
  struct DLL_POPUP_LIB Button : public Widget
  {
    explicit Button(std::string text, std::function<void()> callback = {});

    std::string text;
    std::function<void()> callback;
    bool active = false;  // armed by a press while hovered

    // "ok", "okay" or "close" (any case) with no callback finishes the owning popup
    bool closesPopup() const;

    Button* asButton() override { return this; }
    void updateLayoutCustom(UiContext& ctx, float availableWidth) override;
    void draw(UiContext& ctx) const override;
    bool onEvent(UiContext& ctx, const UIEvent& e) override;
  };

  //-----------------------------------------------------------------------------------------------
  // Lays children out left to right with equal widths and stretches them to the tallest.
  struct DLL_POPUP_LIB Row : public Widget
  {
    Row();

    float spacing = 10.f;

    WidgetBuilder add();
    template<class T>
    T& addWidget(std::unique_ptr<T> w) { return addChild(std::move(w)); }

    Row* asRow() override { return this; }
    void updateLayout(UiContext& ctx) override;
    void updateLayoutCustom(UiContext& ctx, float availableWidth) override;
    void draw(UiContext& ctx) const override;
    bool onEvent(UiContext& ctx, const UIEvent& e) override;
  };
}
