#pragma once
#include "popup_lib.h"

#include <cstdint>
#include <variant>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

namespace Popup_lib
{
  using Vec2 = glm::vec2;
  using Vec4 = glm::vec4;

  // top-left + size, pixels, y grows downward
  struct DLL_POPUP_LIB Rect { float x = 0, y = 0, w = 0, h = 0; };
  inline bool contains(const Rect& r, const Vec2& p) {
    return p.x >= r.x && p.y >= r.y && p.x <= r.x + r.w && p.y <= r.y + r.h;
  }
  inline bool isEmpty(const Rect& r) { return r.w <= 0.f || r.h <= 0.f; }

  enum class PointerButton : uint8_t { None, Left, Right, Middle };

  enum KeyMod : uint8_t { ModNone = 0, ModCtrl = 1, ModShift = 2, ModAlt = 4, ModSuper = 8 };
  inline KeyMod operator|(KeyMod a, KeyMod b) { return static_cast<KeyMod>((int)a | (int)b); }

  //------------------------------------------------------------------
  struct PointerEvent
  {
    enum class Type : uint8_t { Move, Down, Up, Scroll };
    Type type{ Type::Move };
    Vec2 pos{};        // host pixels
    float wheel = 0.f; // for Scroll, >0 scrolls content up
    PointerButton button{ PointerButton::None };
    KeyMod mods{ ModNone };
  };

  //--------------------------------------------------------------
  enum class Key : uint16_t
  {
    Unknown = 0,
    Tab, Enter, Escape, Space,
    Left, Right, Up, Down,
    Home, End,
    Backspace, Delete
  };

  //----------------------------------------------------------------
  struct KeyEvent
  {
    enum class Type : uint8_t { KeyDown, KeyUp, Char };
    Type      type{ Type::KeyDown };
    Key       key{ Key::Unknown };   // for KeyDown/KeyUp
    char32_t  ch{ U'\0' };           // for Type::Char (printable text)
    KeyMod    mods{ ModNone };
  };

  //----------------------------------------------------------------
  struct UIEvent
  {
    enum class Kind : uint8_t { Pointer, Key };
    Kind kind{ Kind::Pointer };
    std::variant<PointerEvent, KeyEvent> data;

    const PointerEvent* pointer() const { return std::get_if<PointerEvent>(&data); }
    const KeyEvent* key() const { return std::get_if<KeyEvent>(&data); }
  };

  inline UIEvent pointerEvent(PointerEvent::Type type, Vec2 pos,
                              PointerButton button = PointerButton::None, float wheel = 0.f)
  {
    PointerEvent p;
    p.type = type; p.pos = pos; p.button = button; p.wheel = wheel;
    return UIEvent{ UIEvent::Kind::Pointer, p };
  }

  inline UIEvent keyDownEvent(Key k)
  {
    KeyEvent ke;
    ke.type = KeyEvent::Type::KeyDown; ke.key = k;
    return UIEvent{ UIEvent::Kind::Key, ke };
  }

  inline UIEvent charEvent(char32_t ch)
  {
    KeyEvent ke;
    ke.type = KeyEvent::Type::Char; ke.ch = ch;
    return UIEvent{ UIEvent::Kind::Key, ke };
  }
}
