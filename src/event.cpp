#include "event.hpp"
#include "procedure.hpp"
#include "ui_thread.hpp"

#include <type_traits>

namespace wisp {

// ---------------------------------------------------------------------------------------------
VirtualKey virtual_key_from_keysym(unsigned long keysym) {
   if (keysym >= XK_a && keysym <= XK_z)
      return static_cast<VirtualKey>(keysym - XK_a + XK_A);
   if (keysym >= XK_A && keysym <= XK_Z)
      return static_cast<VirtualKey>(keysym);
   if (keysym >= XK_0 && keysym <= XK_9)
      return static_cast<VirtualKey>(keysym);
   if (keysym >= XK_KP_0 && keysym <= XK_KP_9)
      return static_cast<VirtualKey>(keysym - XK_KP_0 + XK_0);
   if (keysym >= XK_F1 && keysym <= XK_F12)
      return static_cast<VirtualKey>(keysym);

   switch (keysym) {
   case XK_KP_Enter:
   case XK_Return:
      return VirtualKey::ENTER;
   case XK_KP_Delete:
   case XK_Delete:
      return VirtualKey::DEL;
   case XK_KP_Insert:
   case XK_Insert:
      return VirtualKey::INSERT;
   case XK_KP_Home:
   case XK_Home:
      return VirtualKey::HOME;
   case XK_KP_End:
   case XK_End:
      return VirtualKey::END;
   case XK_KP_Up:
   case XK_Up:
      return VirtualKey::UP;
   case XK_KP_Down:
   case XK_Down:
      return VirtualKey::DOWN;
   case XK_KP_Left:
   case XK_Left:
      return VirtualKey::LEFT;
   case XK_KP_Right:
   case XK_Right:
      return VirtualKey::RIGHT;
   case XK_KP_Page_Up:
   case XK_Page_Up:
      return VirtualKey::PAGE_UP;
   case XK_KP_Page_Down:
   case XK_Page_Down:
      return VirtualKey::PAGE_DOWN;
   case XK_KP_Space:
   case XK_space:
      return VirtualKey::SPACE;
   case XK_KP_Tab:
   case XK_Tab:
   case XK_ISO_Left_Tab:
      return VirtualKey::TAB;
   case XK_BackSpace:
      return VirtualKey::BACKSPACE;
   case XK_Escape:
      return VirtualKey::ESCAPE;
   case XK_grave:
      return VirtualKey::BACKTICK;
   case XK_underscore:
      return VirtualKey::UNDERSCORE;
   case XK_Shift_L:
      return VirtualKey::SHIFT_L;
   case XK_Shift_R:
      return VirtualKey::SHIFT_R;
   case XK_Control_L:
      return VirtualKey::CONTROL_L;
   case XK_Control_R:
      return VirtualKey::CONTROL_R;
   case XK_Alt_L:
      return VirtualKey::ALT_L;
   case XK_Alt_R:
      return VirtualKey::ALT_R;
   default:
      return VirtualKey::unknown;
   }
}

std::optional<ResizingEdge> resizing_edge(NcHitTestValue v) {
   switch (v) {
   case NcHitTestValue::left:
      return ResizingEdge::left;
   case NcHitTestValue::right:
      return ResizingEdge::right;
   case NcHitTestValue::top:
      return ResizingEdge::top;
   case NcHitTestValue::bottom:
      return ResizingEdge::bottom;
   case NcHitTestValue::top_left:
      return ResizingEdge::top_left;
   case NcHitTestValue::top_right:
      return ResizingEdge::top_right;
   case NcHitTestValue::bottom_left:
      return ResizingEdge::bottom_left;
   case NcHitTestValue::bottom_right:
      return ResizingEdge::bottom_right;
   case NcHitTestValue::client:
   case NcHitTestValue::caption:
      break;
   }
   return std::nullopt;
}

// ---------------------------------------------------------------------------------------------
void CloseRequest::destroy() const {
   UiThread::send_task([h = handle] { UiThread::procedure().destroy_window(h); });
}

// ---------------------------------------------------------------------------------------------
template <class T>
static constexpr std::string_view name_of() {
   if constexpr (std::is_same_v<T, Draw>)                      return "Draw";
   else if constexpr (std::is_same_v<T, Moved>)                return "Moved";
   else if constexpr (std::is_same_v<T, Resizing>)             return "Resizing";
   else if constexpr (std::is_same_v<T, Resized>)              return "Resized";
   else if constexpr (std::is_same_v<T, EnterResizing>)        return "EnterResizing";
   else if constexpr (std::is_same_v<T, Maximized>)            return "Maximized";
   else if constexpr (std::is_same_v<T, Restored>)             return "Restored";
   else if constexpr (std::is_same_v<T, Minimized>)            return "Minimized";
   else if constexpr (std::is_same_v<T, CursorEntered>)        return "CursorEntered";
   else if constexpr (std::is_same_v<T, CursorLeft>)           return "CursorLeft";
   else if constexpr (std::is_same_v<T, CursorMoved>)          return "CursorMoved";
   else if constexpr (std::is_same_v<T, MouseInput>)           return "MouseInput";
   else if constexpr (std::is_same_v<T, MouseWheel>)           return "MouseWheel";
   else if constexpr (std::is_same_v<T, KeyInput>)             return "KeyInput";
   else if constexpr (std::is_same_v<T, CharInput>)            return "CharInput";
   else if constexpr (std::is_same_v<T, ImeBeginComposition>)  return "ImeBeginComposition";
   else if constexpr (std::is_same_v<T, ImeUpdateComposition>) return "ImeUpdateComposition";
   else if constexpr (std::is_same_v<T, ImeEndComposition>)    return "ImeEndComposition";
   else if constexpr (std::is_same_v<T, DropFiles>)            return "DropFiles";
   else if constexpr (std::is_same_v<T, NcHitTest>)            return "NcHitTest";
   else if constexpr (std::is_same_v<T, CloseRequest>)         return "CloseRequest";
   else if constexpr (std::is_same_v<T, Closed>)               return "Closed";
   else if constexpr (std::is_same_v<T, Activated>)            return "Activated";
   else if constexpr (std::is_same_v<T, Inactivated>)          return "Inactivated";
   else if constexpr (std::is_same_v<T, ContextMenu>)          return "ContextMenu";
   else if constexpr (std::is_same_v<T, App>)                  return "App";
   else                                                        return "Other";
}

std::string_view event_name(const Event& ev) {
   return std::visit([](const auto& e) { return name_of<std::decay_t<decltype(e)>>(); }, ev);
}

} // namespace wisp
