#include "TextLayout.h"
#include "Utils.h"

#include <cctype>

namespace Popup_lib
{
  namespace {
    bool isSpace(char c) {
      return c != '\n' && std::isspace(static_cast<unsigned char>(c)) != 0;
    }
  }

  //----------------------------------------------------------------------------
  std::vector<TextLine> wrapText(std::string_view s, float maxWidthPx, const MeasureFn& widthOf)
  {
    std::vector<TextLine> out;
    size_t paraStart = 0;

    while (true) {
      const size_t nl = s.find('\n', paraStart);
      const bool hardBreak = nl != std::string_view::npos;
      const size_t paraEnd = hardBreak ? nl : s.size();

      size_t lineStart = paraStart;
      float lineW = 0.f;
      bool lineUsed = false;

      auto flushAt = [&](size_t at) {
        out.push_back({ std::string(s.substr(lineStart, at - lineStart)), lineStart, at });
        lineStart = at;
        lineW = 0.f;
        lineUsed = false;
      };
      auto place = [&](size_t tokStart, float w) {
        if (lineUsed && lineW + w > maxWidthPx) flushAt(tokStart);
        lineW += w;
        lineUsed = true;
      };

      size_t i = paraStart;
      while (i < paraEnd) {
        // token: a run of whitespace or a run of non-whitespace
        const bool space = isSpace(s[i]);
        size_t j = i;
        while (j < paraEnd && isSpace(s[j]) == space) ++j;

        const float w = widthOf(s.substr(i, j - i));
        if (w <= maxWidthPx) {
          place(i, w);
        }
        else {
          // longest prefix that fits, at least one code point
          size_t cs = i;
          while (cs < j) {
            size_t ce = utf8Next(s, cs);
            while (ce < j) {
              const size_t nextCe = utf8Next(s, ce);
              if (widthOf(s.substr(cs, nextCe - cs)) > maxWidthPx) break;
              ce = nextCe;
            }
            place(cs, widthOf(s.substr(cs, ce - cs)));
            cs = ce;
          }
        }
        i = j;
      }

      out.push_back({ std::string(s.substr(lineStart, paraEnd - lineStart)), lineStart,
                      hardBreak ? nl + 1 : paraEnd });
      if (!hardBreak) break;
      paraStart = nl + 1;
    }
    return out;
  }

  //----------------------------------------------------------------------------
  std::string elideFront(std::string_view s, float maxWidthPx, const MeasureFn& widthOf)
  {
    size_t cut = 0;
    while (cut < s.size() && widthOf(s.substr(cut)) > maxWidthPx)
      cut = utf8Next(s, cut);
    return std::string(s.substr(cut));
  }

  //----------------------------------------------------------------------------
  size_t lineForCursor(const std::vector<TextLine>& lines, size_t cursor)
  {
    if (lines.empty()) return 0;
    for (size_t i = 0; i < lines.size(); ++i) {
      const TextLine& l = lines[i];
      if (cursor >= l.start && cursor < l.end) return i;
    }
    return lines.size() - 1;
  }
}
