#include "Theme.h"

namespace Popup_lib
{
  //------------------------------------------------------------------------
  PopupTheme defaultTheme()
  {
    PopupTheme t;
    t.colors = {
      { "popup_bg",           { 0.12f, 0.12f, 0.14f, 0.96f } },
      { "popup_border",       { 0.35f, 0.35f, 0.40f, 1.f } },
      { "header_bg",          { 0.18f, 0.18f, 0.22f, 1.f } },
      { "title_text",         { 1.f,   1.f,   1.f,   1.f } },
      { "text",               { 0.90f, 0.90f, 0.90f, 1.f } },
      { "button_bg",          { 0.25f, 0.25f, 0.30f, 1.f } },
      { "button_hover",       { 0.32f, 0.32f, 0.40f, 1.f } },
      { "button_active",      { 0.20f, 0.40f, 0.70f, 1.f } },
      { "button_text",        { 1.f,   1.f,   1.f,   1.f } },
      { "input_bg",           { 0.08f, 0.08f, 0.10f, 1.f } },
      { "input_text",         { 0.95f, 0.95f, 0.95f, 1.f } },
      { "input_selection",    { 0.20f, 0.40f, 0.80f, 0.5f } },
      { "input_focus_border", { 0.30f, 0.60f, 1.f,   1.f } },
      { "input_cursor",       { 1.f,   1.f,   1.f,   1.f } },
      { "progress_bg",        { 0.15f, 0.15f, 0.18f, 1.f } },
      { "progress_fill",      { 0.20f, 0.60f, 0.30f, 1.f } },
      { "progress_text",      { 1.f,   1.f,   1.f,   1.f } },
      { "progress_border",    { 0.40f, 0.40f, 0.45f, 1.f } },
      { "scroll_track",       { 0.10f, 0.10f, 0.12f, 1.f } },
      { "scroll_thumb",       { 0.35f, 0.35f, 0.40f, 1.f } },
      { "scroll_thumb_hover", { 0.50f, 0.50f, 0.56f, 1.f } },
    };
    return t;
  }
}
