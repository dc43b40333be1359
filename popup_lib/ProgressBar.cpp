#include "ProgressBar.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "Popup.h"
#include "TextLayout.h"

namespace Popup_lib
{
  namespace {
    std::string formatValue(float v) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%g", v);
      return buf;
    }
  }

  //----------------------------------------------------------------------------
  ProgressBar::ProgressBar(float current, float maxValue, std::string text, bool showPercentage_, bool showValues_)
    : Widget(0, 0, 100, 30)
    , showPercentage(showPercentage_)
    , showValues(showValues_)
    , m_current(current)
    , m_max(maxValue)
    , m_text(std::move(text))
    , m_redrawInterval(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<float>(0.2f)))
  {}

  //----------------------------------------------------------------------------
  bool ProgressBar::update(float current, std::optional<float> maxValue, std::optional<std::string> text, bool forceRedraw)
  {
    bool redraw = false;
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_current = current;
      if (maxValue) m_max = *maxValue;
      if (text) m_text = std::move(*text);

      const Clock::time_point now = Clock::now();
      const bool due = !m_lastRedraw || now - *m_lastRedraw > m_redrawInterval;
      if (due || forceRedraw || m_current >= m_max) {
        m_lastRedraw = now;
        redraw = true;
      }
    }
    if (redraw) {
      if (Popup* p = owningPopup()) p->requestRedraw();
    }
    return redraw;
  }

  //----------------------------------------------------------------------------
  float ProgressBar::current() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_current;
  }

  //----------------------------------------------------------------------------
  float ProgressBar::maxValue() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_max;
  }

  //----------------------------------------------------------------------------
  std::string ProgressBar::text() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_text;
  }

  //----------------------------------------------------------------------------
  float ProgressBar::fraction() const
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_max <= 0.f) return 0.f;
    return std::clamp(m_current / m_max, 0.f, 1.f);
  }

  //----------------------------------------------------------------------------
  int ProgressBar::percentage() const
  {
    return static_cast<int>(std::floor(fraction() * 100.f));
  }

  //----------------------------------------------------------------------------
  std::string ProgressBar::displayText() const
  {
    std::string out = text();
    auto append = [&out](const std::string& part) {
      if (!out.empty()) out += ' ';
      out += part;
    };
    if (showPercentage) append(std::to_string(percentage()) + "%");
    if (showValues) append("(" + formatValue(current()) + "/" + formatValue(maxValue()) + ")");
    return out;
  }

  //----------------------------------------------------------------------------
  void ProgressBar::setRedrawInterval(std::chrono::duration<float> interval)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_redrawInterval = std::chrono::duration_cast<Clock::duration>(interval);
  }

  //----------------------------------------------------------------------------
  void ProgressBar::updateLayoutCustom(UiContext& ctx, float)
  {
    height = ctx.layout.progressHeight;
    setRedrawInterval(std::chrono::duration<float>(ctx.layout.progressRedrawInterval));
  }

  //----------------------------------------------------------------------------
  void ProgressBar::draw(UiContext& ctx) const
  {
    IDrawBackend& b = *ctx.backend;
    const float s = ctx.uiScale();
    const Rect r = globalRect(ctx);

    b.drawRect(r, ctx.color("progress_bg"));
    const float fillW = std::floor(r.w * fraction());
    if (fillW > 0.f) b.drawRect({ r.x, r.y, fillW, r.h }, ctx.color("progress_fill"));
    b.drawRectBorder(r, ctx.color("progress_border"), 1.f);

    std::string label = displayText();
    if (label.empty()) return;

    const float px = ctx.fontPx(0.f, ctx.layout.progressFontScale);
    const auto widthOf = [&](std::string_view v) { return ctx.measureText(v, px).x; };
    const float pad = ctx.layout.progressTextPadding * s;
    const float avail = r.w - 2.f * pad;

    Vec2 ext = ctx.measureText(label, px);
    float tx = r.x + (r.w - ext.x) * 0.5f;
    if (ext.x > avail) {
      // keep the tail (the numbers), right aligned
      label = elideFront(label, avail, widthOf);
      ext = ctx.measureText(label, px);
      tx = r.x + r.w - pad - ext.x;
    }
    b.drawText(label, { tx, r.y + (r.h - ext.y) * 0.5f }, px, ctx.color("progress_text"));
  }
}
