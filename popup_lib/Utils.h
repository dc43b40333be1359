#pragma once
#include "base.h"

#include <algorithm>
#include <exception>
#include <string>
#include <string_view>

#include <base/Log.h>

namespace Popup_lib
{
  //-----------------------------------------------------------------------------
  inline Rect intersect(const Rect& a, const Rect& b)
  {
    float x0 = std::max(a.x, b.x);
    float y0 = std::max(a.y, b.y);
    float x1 = std::min(a.x + a.w, b.x + b.w);
    float y1 = std::min(a.y + a.h, b.y + b.h);
    return Rect{ x0, y0, std::max(0.f, x1 - x0), std::max(0.f, y1 - y0) };
  }

  // lo wins when the range is inverted (widget bigger than its bounds)
  inline float clampLow(float v, float lo, float hi)
  {
    return std::max(lo, std::min(v, hi));
  }

  //-----------------------------------------------------------------------------
  inline bool isUtf8Continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

  // byte index of the next code point boundary after i
  inline size_t utf8Next(std::string_view s, size_t i)
  {
    if (i >= s.size()) return s.size();
    ++i;
    while (i < s.size() && isUtf8Continuation(static_cast<unsigned char>(s[i]))) ++i;
    return i;
  }

  // byte index of the code point boundary before i
  inline size_t utf8Prev(std::string_view s, size_t i)
  {
    if (i == 0) return 0;
    i = std::min(i, s.size());
    --i;
    while (i > 0 && isUtf8Continuation(static_cast<unsigned char>(s[i]))) --i;
    return i;
  }

  // snaps i back onto a code point boundary
  inline size_t utf8Floor(std::string_view s, size_t i)
  {
    i = std::min(i, s.size());
    while (i > 0 && i < s.size() && isUtf8Continuation(static_cast<unsigned char>(s[i]))) --i;
    return i;
  }

  inline size_t utf8Length(std::string_view s)
  {
    size_t n = 0;
    for (unsigned char c : s)
      if (!isUtf8Continuation(c)) ++n;
    return n;
  }

  inline std::string utf8Encode(char32_t cp)
  {
    std::string out;
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    }
    else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp <= 0x10FFFF) {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
  }

  //-----------------------------------------------------------------------------
  // Runs a user callback; a thrown std::exception is logged and reported as false.
  template<class Fn>
  bool invokeGuarded(const char* what, Fn&& fn)
  {
    try {
      fn();
      return true;
    }
    catch (const std::exception& e) {
      base::LogError("%s failed: %s", what, e.what());
      return false;
    }
  }
}
