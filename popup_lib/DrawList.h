#pragma once
#include "base.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Popup_lib
{
  //--------------------------------------------------
  struct Vertex
  {
    float x, y; // position, host px
    Vec4 color;
  };

  enum class DrawKind : uint8_t { Solid, Text };

  //--------------------------------------------------
  struct TextRun
  {
    std::string text;
    Vec2 pos{};      // top-left
    float fontSize = 0.f;
    Vec4 color{};
  };

  //--------------------------------------------------
  struct DrawCmd
  {
    DrawKind kind = DrawKind::Solid;
    Rect clip{};
    uint32_t idxOffset = 0;   // Solid: into indices
    uint32_t idxCount = 0;
    uint32_t textOffset = 0;  // Text: into texts
    uint32_t textCount = 0;
  };

  //--------------------------------------------------
  struct DLL_POPUP_LIB DrawList
  {
    std::vector<Vertex> verts;
    std::vector<uint32_t> indices;
    std::vector<TextRun> texts;
    std::vector<DrawCmd> cmds;

    void clear() { verts.clear(); indices.clear(); texts.clear(); cmds.clear(); }
    size_t quadCount() const { return indices.size() / 6; }
  };
}
