#pragma once
#include "Widget.h"

#include <chrono>

namespace Popup_lib
{
  //-----------------------------------------------------------------------------------------------
  // Progress display. update() may be called from any thread; it never lays out or draws.
  struct DLL_POPUP_LIB ProgressBar : public Widget
  {
    using Clock = std::chrono::steady_clock;

    explicit ProgressBar(float current = 0.f, float maxValue = 100.f, std::string text = {},
                         bool showPercentage = true, bool showValues = false);

    bool showPercentage = true;
    bool showValues = false;

    // Returns true when a redraw was requested. Redraws are throttled to one per
    // redraw interval unless forced or current >= maxValue.
    bool update(float current, std::optional<float> maxValue = std::nullopt,
                std::optional<std::string> text = std::nullopt, bool forceRedraw = false);

    float current() const;
    float maxValue() const;
    std::string text() const;
    // clamp(current / maxValue, 0, 1), 0 when maxValue <= 0
    float fraction() const;
    // floor(fraction * 100)
    int percentage() const;
    // "<text> NN% (current/max)" with the parts that are enabled
    std::string displayText() const;

    void setRedrawInterval(std::chrono::duration<float> interval);

    void updateLayoutCustom(UiContext& ctx, float availableWidth) override;
    void draw(UiContext& ctx) const override;

  private:
    mutable std::mutex m_mutex;
    float m_current = 0.f;
    float m_max = 100.f;
    std::string m_text;
    Clock::duration m_redrawInterval;
    std::optional<Clock::time_point> m_lastRedraw;
  };
}
