#include "style.hpp"

namespace wisp {

bool gtk_theme_is_dark(std::string_view gtk_theme) {
   auto pos = gtk_theme.rfind(':');
   return pos != std::string_view::npos && gtk_theme.substr(pos + 1) == "dark";
}

ColorModeState resolve_color_mode(ColorMode mode, ColorModeState system_default) {
   switch (mode) {
   case ColorMode::light:
      return ColorModeState::light;
   case ColorMode::dark:
      return ColorModeState::dark;
   case ColorMode::system:
      break;
   }
   return system_default;
}

} // namespace wisp
