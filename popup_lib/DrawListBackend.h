#pragma once
#include "popup_lib.h"
#include "DrawList.h"
#include "Interfaces.h"

#include <vector>

namespace Popup_lib
{
  // IDrawBackend that batches quads and text runs into a DrawList for a renderer to consume.
  // Primitives falling entirely outside the current clip are dropped.
  class DLL_POPUP_LIB DrawListBackend : public IDrawBackend
  {
  public:
    explicit DrawListBackend(DrawList* target = nullptr, Rect viewport = { 0, 0, 1920, 1080 })
      : m_target(target), m_viewport(viewport) {}

    // Non-owning; valid only while you're building a frame.
    void setTarget(DrawList* dl) noexcept { m_target = dl; }
    DrawList* target() const noexcept { return m_target; }
    void setViewport(const Rect& r) { m_viewport = r; }

    void drawRect(const Rect& r, const Vec4& color) override;
    void drawRectBorder(const Rect& r, const Vec4& color, float thickness) override;
    void pushClip(const Rect& r) override;
    void popClip() override;
    void drawText(std::string_view text, const Vec2& pos, float fontSize, const Vec4& color) override;

    Rect currentClip() const { return m_clip.empty() ? m_viewport : m_clip.back(); }
    size_t clipDepth() const { return m_clip.size(); }

  private:
    DrawList* m_target = nullptr; // not owned
    Rect m_viewport;
    std::vector<Rect> m_clip;
  };
}
