#include "Widget.h"

#include <algorithm>
#include <cctype>

#include "Popup.h"
#include "TextLayout.h"
#include "Utils.h"
#include "WidgetBuilder.h"

namespace Popup_lib
{
  //----------------------------------------------------------------------------
  Widget::Widget(float x_, float y_, float w_, float h_)
    : x(x_), y(y_), width(w_), height(h_)
  {}

  //----------------------------------------------------------------------------
  float Widget::globalX(const UiContext& ctx) const
  {
    if (!parent) return x;
    return parent->childOrigin(ctx, *this).x + x * ctx.uiScale();
  }

  //----------------------------------------------------------------------------
  float Widget::globalY(const UiContext& ctx) const
  {
    if (!parent) return y;
    return parent->childOrigin(ctx, *this).y + y * ctx.uiScale();
  }

  //----------------------------------------------------------------------------
  Rect Widget::globalRect(const UiContext& ctx) const
  {
    return Rect{ globalX(ctx), globalY(ctx), scaledWidth(ctx), scaledHeight(ctx) };
  }

  //----------------------------------------------------------------------------
  bool Widget::isInside(const UiContext& ctx, const Vec2& p) const
  {
    return contains(globalRect(ctx), p);
  }

  //----------------------------------------------------------------------------
  Vec2 Widget::childOrigin(const UiContext& ctx, const Widget&) const
  {
    return Vec2{ globalX(ctx), globalY(ctx) };
  }

  //----------------------------------------------------------------------------
  Popup* Widget::owningPopup()
  {
    for (Widget* w = this; w; w = w->parent)
      if (Popup* p = w->asPopup()) return p;
    return nullptr;
  }

  //----------------------------------------------------------------------------
  Label::Label(std::string text, float fontSize_, std::optional<Vec4> color_)
    : fontSize(fontSize_), color(color_), m_text(std::move(text))
  {}

  //----------------------------------------------------------------------------
  std::string Label::text() const
  {
    std::lock_guard<std::mutex> lk(m_textMutex);
    return m_text;
  }

  //----------------------------------------------------------------------------
  void Label::update(std::string text)
  {
    {
      std::lock_guard<std::mutex> lk(m_textMutex);
      m_text = std::move(text);
    }
    if (Popup* p = owningPopup()) {
      p->markLayoutDirty();
      p->requestRedraw();
    }
  }

  //----------------------------------------------------------------------------
  void Label::updateLayoutCustom(UiContext& ctx, float availableWidth)
  {
    const float s = ctx.uiScale();
    const float px = ctx.fontPx(fontSize, ctx.layout.fontScale);
    const std::string t = text();

    lines.clear();
    for (const TextLine& l : wrapText(t, availableWidth * s,
                                      [&](std::string_view v) { return ctx.measureText(v, px).x; }))
      lines.push_back(l.text);

    lineHeight = ctx.lineHeight(px);
    height = lines.size() * lineHeight / s + 10.f;
  }

  //----------------------------------------------------------------------------
  void Label::draw(UiContext& ctx) const
  {
    const float s = ctx.uiScale();
    const float px = ctx.fontPx(fontSize, ctx.layout.fontScale);
    const float lh = lineHeight > 0.f ? lineHeight : ctx.lineHeight(px);
    const Vec4 col = color ? *color : ctx.color("text");

    // not laid out yet: fall back to the raw paragraphs
    std::vector<std::string> raw;
    const std::vector<std::string>* toDraw = &lines;
    if (lines.empty()) {
      const std::string t = text();
      size_t start = 0;
      while (true) {
        const size_t nl = t.find('\n', start);
        raw.push_back(t.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if (nl == std::string::npos) break;
        start = nl + 1;
      }
      toDraw = &raw;
    }

    const float gx = globalX(ctx);
    float cy = globalY(ctx) + 5.f * s;
    for (const std::string& line : *toDraw) {
      const float th = ctx.measureText(line, px).y;
      ctx.backend->drawText(line, { gx, cy + (lh - th) * 0.5f }, px, col);
      cy += lh;
    }
  }

  //----------------------------------------------------------------------------
  Button::Button(std::string text_, std::function<void()> callback_)
    : Widget(0, 0, 100, 30), text(std::move(text_)), callback(std::move(callback_))
  {}

  //----------------------------------------------------------------------------
  bool Button::closesPopup() const
  {
    if (callback) return false;
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "ok" || lower == "okay" || lower == "close";
  }

  //----------------------------------------------------------------------------
  void Button::updateLayoutCustom(UiContext& ctx, float)
  {
    const float s = ctx.uiScale();
    const float px = ctx.fontPx(0.f, ctx.layout.fontScale);
    const float textH = ctx.measureText(text, px).y;
    height = (textH + 2.f * ctx.layout.buttonPadding * s) / s;
  }

  //----------------------------------------------------------------------------
  void Button::draw(UiContext& ctx) const
  {
    const Rect r = globalRect(ctx);
    const char* role = (active && hover) ? "button_active" : hover ? "button_hover" : "button_bg";
    ctx.backend->drawRect(r, ctx.color(role));

    const float px = ctx.fontPx(0.f, ctx.layout.fontScale);
    const Vec2 ext = ctx.measureText(text, px);
    ctx.backend->drawText(text, { r.x + (r.w - ext.x) * 0.5f, r.y + (r.h - ext.y) * 0.5f }, px,
                          ctx.color("button_text"));
  }

  //----------------------------------------------------------------------------
  bool Button::onEvent(UiContext&, const UIEvent& e)
  {
    const PointerEvent* p = e.pointer();
    if (!p || p->button != PointerButton::Left) return false;

    if (p->type == PointerEvent::Type::Down) {
      if (!hover) return false;
      active = true;
      return true;
    }
    if (p->type != PointerEvent::Type::Up) return false;

    const bool wasActive = active;
    active = false;
    if (!wasActive) return false;
    if (!hover) return true; // released elsewhere: swallow, no click

    if (callback)
      return invokeGuarded("button callback", callback);
    if (closesPopup()) {
      if (Popup* popup = owningPopup()) popup->finished = true;
    }
    return true;
  }

  //----------------------------------------------------------------------------
  Row::Row()
    : Widget(0, 0, 100, 30)
  {}

  //----------------------------------------------------------------------------
  WidgetBuilder Row::add()
  {
    return WidgetBuilder(*this);
  }

  //----------------------------------------------------------------------------
  void Row::updateLayout(UiContext& ctx)
  {
    if (children.empty()) return;

    const size_t n = children.size();
    const float childW = std::max(0.f, (width - spacing * (n - 1)) / n);

    float maxH = 0.f;
    for (auto& c : children) {
      c->width = childW;
      c->updateLayoutCustom(ctx, childW);
      maxH = std::max(maxH, c->height);
    }
    height = std::max(ctx.layout.rowHeight, maxH);

    float cx = 0.f;
    for (auto& c : children) {
      c->x = cx;
      c->y = 0.f;
      c->width = childW;
      c->height = height;
      cx += childW + spacing;
    }
  }

  //----------------------------------------------------------------------------
  void Row::updateLayoutCustom(UiContext& ctx, float availableWidth)
  {
    width = availableWidth;
    updateLayout(ctx);
  }

  //----------------------------------------------------------------------------
  void Row::draw(UiContext& ctx) const
  {
    for (const auto& c : children) c->draw(ctx);
  }

  //----------------------------------------------------------------------------
  bool Row::onEvent(UiContext& ctx, const UIEvent& e)
  {
    if (const PointerEvent* p = e.pointer()) {
      for (auto& c : children) c->hover = hover && c->isInside(ctx, p->pos);
    }
    for (auto& c : children)
      if (c->onEvent(ctx, e)) return true;
    return false;
  }
}
