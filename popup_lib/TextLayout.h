#pragma once
#include "popup_lib.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Popup_lib
{
  using MeasureFn = std::function<float(std::string_view)>; // width in px

  // One visual line. [start, end) are byte offsets into the source text;
  // end includes the '\n' that closed the line, text never does.
  struct TextLine
  {
    std::string text;
    size_t start = 0;
    size_t end = 0;
  };

  // Greedy word wrap over whitespace/non-whitespace tokens. Hard newlines always break
  // and words wider than maxWidthPx are split by code point.
  // Text ending in '\n' (and empty text) yields a final empty line.
  DLL_POPUP_LIB std::vector<TextLine> wrapText(std::string_view s, float maxWidthPx, const MeasureFn& widthOf);

  // Drops leading code points until the rest fits maxWidthPx.
  DLL_POPUP_LIB std::string elideFront(std::string_view s, float maxWidthPx, const MeasureFn& widthOf);

  // Index of the line holding the caret; a caret on a shared boundary belongs to the later line.
  DLL_POPUP_LIB size_t lineForCursor(const std::vector<TextLine>& lines, size_t cursor);
}
