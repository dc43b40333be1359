#pragma once
#include "Widget.h"
#include "TextLayout.h"

#include <utility>

namespace Popup_lib
{
  //-----------------------------------------------------------------------------------------------
  // Multi-line editable text. Indices are UTF-8 byte offsets that always sit on code point boundaries.
  struct DLL_POPUP_LIB TextInput : public Widget
  {
    explicit TextInput(std::string text = {});

    std::string text;
    size_t cursorPos = 0;                 // 0..text.size()
    std::optional<size_t> selectionStart; // both set or both unset, unordered
    std::optional<size_t> selectionEnd;
    bool isSelecting = false;             // left button held after a press inside
    std::vector<TextLine> lines;          // spans over the full text, '\n' included
    float lineHeight = 0.f;               // px
    float padding = 10.f;                 // logical, from the layout metrics on each layout

    // replaces the buffer, caret to the end, selection cleared
    void setText(std::string t);

    // drops focus and any selection, the text stays
    void blur();

    bool hasSelection() const;
    // ordered [min, max) of the selection, {cursorPos, cursorPos} when none
    std::pair<size_t, size_t> selectionRange() const;
    std::string selectedText() const;

    // text index closest to a host px point
    size_t cursorFromPointer(const UiContext& ctx, const Vec2& p) const;

    TextInput* asTextInput() override { return this; }
    void updateLayoutCustom(UiContext& ctx, float availableWidth) override;
    void draw(UiContext& ctx) const override;
    bool onEvent(UiContext& ctx, const UIEvent& e) override;

  private:
    bool onKey(UiContext& ctx, const KeyEvent& k);
    void clearSelection();
    bool deleteSelection();
    void insertText(const std::string& s);
    void textChanged(UiContext& ctx);
    float fontPx(const UiContext& ctx) const { return ctx.fontPx(0.f, ctx.layout.fontScale); }

    float m_lastAvailableWidth = 100.f;
  };
}
