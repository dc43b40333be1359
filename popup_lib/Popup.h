#pragma once
#include "Widget.h"
#include "Scrollbar.h"
#include "WidgetBuilder.h"

#include <atomic>

namespace Popup_lib
{
  //-----------------------------------------------------------------------------------------------
  // Root of a modal dialog: title bar, vertically stacked children, optional scrolling.
  // x/y are host px; children are laid out in logical units below the title bar.
  // Layout, draw and events belong to the UI thread. Label/ProgressBar updates from
  // other threads only go through markLayoutDirty() and requestRedraw().
  class DLL_POPUP_LIB Popup : public Widget
  {
  public:
    explicit Popup(std::string title, std::string label = {},
                   std::optional<float> width = std::nullopt, std::optional<float> height = std::nullopt,
                   bool preventClose = false, bool blocking = false);

    std::string title;
    // workers may poll these
    std::atomic<bool> finished{ false };
    std::atomic<bool> cancelled{ false };
    bool shown = false;     // handed to a PopupManager (active or queued)
    bool blocking = false;  // swallow every event while active
    std::function<void()> onEnter;
    std::function<void()> onCancel;
    std::function<void(Popup&)> onClosed; // called by PopupManager when the session ends

    float scrollOffset = 0.f;        // logical
    float maxScroll = 0.f;
    bool  isScrollable = false;
    float contentHeight = 0.f;       // padding + children + gaps + margin
    float visibleContentHeight = 0.f;
    bool  isDragging = false;
    Vec2  dragOffset{};

    bool preventClose() const { return m_preventClose; }
    // takes effect on the next render
    void setPreventClose(bool value);

    WidgetBuilder add();
    template<class T>
    T& addWidget(std::unique_ptr<T> w) { return addChild(std::move(w)); }
    // finishes the popup and becomes the Enter action if none is set; relayout on next render
    Button& addCloseButton(const std::string& text = "OK");
    // any Button among the children or one level into Rows
    bool hasButton() const;

    // full layout against ctx.region: default button, children, centring
    void updateLayout(UiContext& ctx) override;
    // rewrap and restack children, keeps the position
    void layoutChildren(UiContext& ctx);
    // applies pending layout, then draws
    void render(UiContext& ctx);
    void draw(UiContext& ctx) const override;
    bool onEvent(UiContext& ctx, const UIEvent& e) override;
    Vec2 childOrigin(const UiContext& ctx, const Widget& child) const override;
    Popup* asPopup() override { return this; }

    Rect titleBar(const UiContext& ctx) const;
    Rect contentClip(const UiContext& ctx) const;
    Scrollbar* scrollbar() const { return m_scrollbar.get(); }
    void scrollTo(float offset);

    // safe from any thread; a no-op until the popup was laid out or drawn
    void requestRedraw() const;
    // the port is taken from the context on layout and render and must outlive its use
    void setRedrawPort(IRedrawPort* port) { m_redraw = port; }
    void markLayoutDirty() { m_needsRelayout = true; }
    bool layoutDirty() const { return m_needsRelayout || m_needsFullLayout; }

  private:
    void ensureDefaultButton();
    float measureChildren(UiContext& ctx, float contentWidth);
    void updateHover(const UiContext& ctx, const Vec2& p);
    bool onKey(const KeyEvent& k);
    void blurInputsOutside(const UiContext& ctx, const Vec2& p);

    std::unique_ptr<Scrollbar> m_scrollbar;
    bool m_autoWidth;
    bool m_autoHeight;
    bool m_preventClose;
    bool m_laidOut = false;
    std::atomic<bool> m_needsRelayout{ false };
    std::atomic<bool> m_needsFullLayout{ false };
    std::atomic<IRedrawPort*> m_redraw{ nullptr };
    std::optional<Vec2> m_lastPointer;
  };
}
