#include "TextInput.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "Popup.h"
#include "Utils.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  TextInput::TextInput(std::string t)
    : Widget(0, 0, 100, 30), text(std::move(t))
  {
    cursorPos = text.size();
  }

  //----------------------------------------------------------------------------
  void TextInput::setText(std::string t)
  {
    text = std::move(t);
    cursorPos = text.size();
    clearSelection();
    lines.clear();
  }

  //----------------------------------------------------------------------------
  void TextInput::blur()
  {
    focused = false;
    isSelecting = false;
    clearSelection();
  }

  //----------------------------------------------------------------------------
  bool TextInput::hasSelection() const
  {
    return selectionStart && selectionEnd && *selectionStart != *selectionEnd;
  }

  //----------------------------------------------------------------------------
  std::pair<size_t, size_t> TextInput::selectionRange() const
  {
    if (!hasSelection()) return { cursorPos, cursorPos };
    const size_t a = std::min(*selectionStart, text.size());
    const size_t b = std::min(*selectionEnd, text.size());
    return { std::min(a, b), std::max(a, b) };
  }

  //----------------------------------------------------------------------------
  std::string TextInput::selectedText() const
  {
    const auto [a, b] = selectionRange();
    return text.substr(a, b - a);
  }

  //----------------------------------------------------------------------------
  void TextInput::clearSelection()
  {
    selectionStart.reset();
    selectionEnd.reset();
  }

  //----------------------------------------------------------------------------
  bool TextInput::deleteSelection()
  {
    if (!hasSelection()) return false;
    const auto [a, b] = selectionRange();
    text.erase(a, b - a);
    cursorPos = a;
    clearSelection();
    return true;
  }

  //----------------------------------------------------------------------------
  void TextInput::insertText(const std::string& s)
  {
    deleteSelection();
    cursorPos = std::min(cursorPos, text.size());
    text.insert(cursorPos, s);
    cursorPos += s.size();
  }

  //----------------------------------------------------------------------------
  void TextInput::textChanged(UiContext& ctx)
  {
    // heights of everything below may change, rewrap the whole popup
    if (Popup* p = owningPopup()) p->layoutChildren(ctx);
    else updateLayoutCustom(ctx, m_lastAvailableWidth);
  }

  //----------------------------------------------------------------------------
  void TextInput::updateLayoutCustom(UiContext& ctx, float availableWidth)
  {
    m_lastAvailableWidth = availableWidth;
    padding = ctx.layout.inputPadding;
    const float s = ctx.uiScale();
    const float px = fontPx(ctx);
    const float textArea = (availableWidth - 2.f * padding) * s;

    lines = wrapText(text, textArea, [&](std::string_view v) { return ctx.measureText(v, px).x; });
    lineHeight = ctx.lineHeight(px);

    const size_t n = std::max<size_t>(1, lines.size());
    height = (n * lineHeight + 2.f * padding * s) / s;
  }

  //----------------------------------------------------------------------------
  size_t TextInput::cursorFromPointer(const UiContext& ctx, const Vec2& p) const
  {
    if (lines.empty()) return text.size();

    const float s = ctx.uiScale();
    const float px = fontPx(ctx);
    const float top = globalY(ctx) + padding * s;
    const float lh = lineHeight > 0.f ? lineHeight : ctx.lineHeight(px);

    long idx = static_cast<long>(std::floor((p.y - top) / lh));
    idx = std::max(0L, std::min(idx, static_cast<long>(lines.size()) - 1));
    const TextLine& line = lines[static_cast<size_t>(idx)];

    const float relX = p.x - (globalX(ctx) + padding * s);
    size_t best = 0;
    float bestDist = std::numeric_limits<float>::max();
    size_t i = 0;
    while (true) {
      const float d = std::fabs(ctx.measureText(std::string_view(line.text).substr(0, i), px).x - relX);
      if (d >= bestDist) break; // first non-improving prefix ends the scan
      bestDist = d;
      best = i;
      if (i >= line.text.size()) break;
      i = utf8Next(line.text, i);
    }
    return line.start + best;
  }

  //----------------------------------------------------------------------------
  void TextInput::draw(UiContext& ctx) const
  {
    IDrawBackend& b = *ctx.backend;
    const float s = ctx.uiScale();
    const float px = fontPx(ctx);
    const Rect r = globalRect(ctx);

    b.drawRect(r, ctx.color("input_bg"));
    if (focused) b.drawRectBorder(r, ctx.color("input_focus_border"), 1.f);

    const float lh = lineHeight > 0.f ? lineHeight : ctx.lineHeight(px);
    const float textX = r.x + padding * s;
    const Vec4 textCol = ctx.color("input_text");
    const bool sel = hasSelection();
    const auto [selMin, selMax] = selectionRange();
    const auto widthOf = [&](std::string_view v) { return ctx.measureText(v, px).x; };

    std::vector<TextLine> unwrapped;
    const std::vector<TextLine>* toDraw = &lines;
    if (lines.empty()) {
      unwrapped.push_back({ text, 0, text.size() });
      toDraw = &unwrapped;
    }
    const size_t caretLine = lineForCursor(*toDraw, cursorPos);

    b.pushClip(r);
    float cy = r.y + padding * s;
    for (size_t li = 0; li < toDraw->size(); ++li) {
      const TextLine& line = (*toDraw)[li];
      const std::string_view lt(line.text);

      if (sel && selMax > line.start && selMin < line.end) {
        const size_t a = std::min(selMin > line.start ? selMin - line.start : 0, lt.size());
        const size_t e = std::min(selMax - line.start, lt.size());
        const float x0 = widthOf(lt.substr(0, a));
        const float w = widthOf(lt.substr(a, e - a));
        b.drawRect({ textX + x0, cy, w, lh }, ctx.color("input_selection"));
      }

      const float th = ctx.measureText(lt, px).y;
      b.drawText(lt, { textX, cy + (lh - th) * 0.5f }, px, textCol);

      if (focused && li == caretLine) {
        const size_t at = std::min(cursorPos - std::min(cursorPos, line.start), lt.size());
        b.drawRect({ textX + widthOf(lt.substr(0, at)), cy, 2.f * s, lh }, ctx.color("input_cursor"));
      }
      cy += lh;
    }
    b.popClip();
  }

  //----------------------------------------------------------------------------
  bool TextInput::onEvent(UiContext& ctx, const UIEvent& e)
  {
    if (const PointerEvent* p = e.pointer()) {
      if (p->button == PointerButton::Left && p->type == PointerEvent::Type::Down) {
        if (hover) {
          focused = true;
          isSelecting = true;
          const size_t pos = cursorFromPointer(ctx, p->pos);
          cursorPos = pos;
          selectionStart = pos;
          selectionEnd = pos;
          return true;
        }
        blur();
        return false;
      }
      if (p->button == PointerButton::Left && p->type == PointerEvent::Type::Up) {
        if (!isSelecting) return false;
        isSelecting = false;
        return true;
      }
      if (p->type == PointerEvent::Type::Move && isSelecting) {
        const size_t pos = cursorFromPointer(ctx, p->pos);
        cursorPos = pos;
        selectionEnd = pos;
        return true;
      }
      return false;
    }

    if (const KeyEvent* k = e.key()) {
      if (!focused) return false;
      return onKey(ctx, *k);
    }
    return false;
  }

  //----------------------------------------------------------------------------
  bool TextInput::onKey(UiContext& ctx, const KeyEvent& k)
  {
    cursorPos = utf8Floor(text, cursorPos);

    if (k.type == KeyEvent::Type::Char) {
      // control characters arrive as KeyDown, not text
      if (k.ch < 0x20 || k.ch == 0x7F) return false;
      insertText(utf8Encode(k.ch));
      textChanged(ctx);
      return true;
    }
    if (k.type != KeyEvent::Type::KeyDown) return false;

    switch (k.key) {
    case Key::Backspace:
      if (!deleteSelection()) {
        if (cursorPos == 0) return false;
        const size_t prev = utf8Prev(text, cursorPos);
        text.erase(prev, cursorPos - prev);
        cursorPos = prev;
      }
      textChanged(ctx);
      return true;

    case Key::Delete:
      if (!deleteSelection()) {
        if (cursorPos >= text.size()) return false;
        text.erase(cursorPos, utf8Next(text, cursorPos) - cursorPos);
      }
      textChanged(ctx);
      return true;

    case Key::Enter:
      insertText("\n");
      textChanged(ctx);
      return true;

    case Key::Left:
      cursorPos = utf8Prev(text, cursorPos);
      clearSelection();
      return true;

    case Key::Right:
      cursorPos = utf8Next(text, cursorPos);
      clearSelection();
      return true;

    case Key::Escape:
      focused = false;
      isSelecting = false;
      return false;

    default:
      return false;
    }
  }
}
