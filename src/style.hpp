#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace wisp {

// ---------------------------------------------------------------------------------------------
enum class Cursor : uint32_t {
   arrow     = 0,
   hand      = 1,
   ibeam     = 2,
   wait      = 3,
   cross     = 4,
   no        = 5,
   size_all  = 6,
   size_ns   = 7,
   size_we   = 8,
   size_nesw = 9,
   size_nwse = 10,
   count     = 11,
};

// ---------------------------------------------------------------------------------------------
enum class ColorMode : uint32_t { system, light, dark };

enum class ColorModeState : uint32_t { light, dark };

// `system` follows $GTK_THEME (a ":dark" suffix selects dark) unless `system_default` says otherwise
ColorModeState resolve_color_mode(ColorMode mode, ColorModeState system_default);

bool gtk_theme_is_dark(std::string_view gtk_theme);

// ---------------------------------------------------------------------------------------------
// Decorations requested from the window manager (`_MOTIF_WM_HINTS`, `WM_NORMAL_HINTS`)
// ---------------------------------------------------------------------------------------------
struct WindowStyle {
   bool resizable    = true;
   bool minimize_box = true;
   bool maximize_box = true;
   bool borderless   = false;

   static WindowStyle overlapped() { return {}; }
   static WindowStyle dialog() { return {.resizable = false, .minimize_box = false, .maximize_box = false}; }
   static WindowStyle borderless_window() { return {.borderless = true}; }

   bool operator==(const WindowStyle&) const = default;
};

// ---------------------------------------------------------------------------------------------
// Window icon as non-premultiplied 0xAARRGGBB pixels, row major (`_NET_WM_ICON`)
// ---------------------------------------------------------------------------------------------
struct Icon {
   uint32_t              width  = 0;
   uint32_t              height = 0;
   std::vector<uint32_t> argb;

   bool valid() const { return width && height && argb.size() == size_t(width) * height; }
};

} // namespace wisp
