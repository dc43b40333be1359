#include "DrawListBackend.h"
#include "Utils.h"

namespace Popup_lib
{
  namespace {
    bool sameRect(const Rect& a, const Rect& b) {
      return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
    }

    // continue the last command when kind and clip match, else open a new one
    DrawCmd& batchFor(DrawList& dl, DrawKind kind, const Rect& clip) {
      if (dl.cmds.empty() || dl.cmds.back().kind != kind || !sameRect(dl.cmds.back().clip, clip)) {
        DrawCmd dc;
        dc.kind = kind;
        dc.clip = clip;
        dc.idxOffset = static_cast<uint32_t>(dl.indices.size());
        dc.textOffset = static_cast<uint32_t>(dl.texts.size());
        dl.cmds.emplace_back(dc);
      }
      return dl.cmds.back();
    }

    void pushQuadBatched(DrawList& dl, const Rect& dst, const Vec4& color, const Rect& clip) {
      DrawCmd& cmd = batchFor(dl, DrawKind::Solid, clip);

      const uint32_t base = static_cast<uint32_t>(dl.verts.size());
      dl.verts.push_back({ dst.x,         dst.y,         color });
      dl.verts.push_back({ dst.x + dst.w, dst.y,         color });
      dl.verts.push_back({ dst.x + dst.w, dst.y + dst.h, color });
      dl.verts.push_back({ dst.x,         dst.y + dst.h, color });

      const uint32_t idx[6] = { base, base + 1, base + 2, base, base + 2, base + 3 };
      dl.indices.insert(dl.indices.end(), idx, idx + 6);
      cmd.idxCount += 6;
    }
  }

  //--------------------------------------------------------------------------------
  void DrawListBackend::drawRect(const Rect& r, const Vec4& color)
  {
    if (!m_target) return;
    const Rect clip = currentClip();
    if (isEmpty(intersect(clip, r))) return;
    pushQuadBatched(*m_target, r, color, clip);
  }

  //--------------------------------------------------------------------------------
  void DrawListBackend::drawRectBorder(const Rect& r, const Vec4& color, float thickness)
  {
    const float t = std::max(1.f, thickness);
    drawRect({ r.x, r.y, r.w, t }, color);
    drawRect({ r.x, r.y + r.h - t, r.w, t }, color);
    drawRect({ r.x, r.y, t, r.h }, color);
    drawRect({ r.x + r.w - t, r.y, t, r.h }, color);
  }

  //--------------------------------------------------------------------------------
  void DrawListBackend::pushClip(const Rect& r)
  {
    m_clip.push_back(m_clip.empty() ? intersect(m_viewport, r) : intersect(m_clip.back(), r));
  }

  //--------------------------------------------------------------------------------
  void DrawListBackend::popClip()
  {
    if (!m_clip.empty()) m_clip.pop_back();
  }

  //--------------------------------------------------------------------------------
  void DrawListBackend::drawText(std::string_view text, const Vec2& pos, float fontSize, const Vec4& color)
  {
    if (!m_target || text.empty()) return;
    const Rect clip = currentClip();
    // text width is unknown here, cull on the vertical band only
    if (isEmpty(intersect(clip, { clip.x, pos.y, clip.w, std::max(1.f, fontSize) }))) return;

    DrawCmd& cmd = batchFor(*m_target, DrawKind::Text, clip);
    m_target->texts.push_back({ std::string(text), pos, fontSize, color });
    ++cmd.textCount;
  }
}
