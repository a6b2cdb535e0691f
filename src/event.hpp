#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <X11/Xlib.h>
#include <X11/keysym.h>

#include "channel.hpp"
#include "geometry.hpp"
#include "handle.hpp"

namespace wisp {

// ---------------------------------------------------------------------------------------------
//                              input
// ---------------------------------------------------------------------------------------------
enum class MouseButton : uint32_t { left, right, middle, ex1, ex2 };

enum class ButtonState : uint32_t { pressed, released };

enum class KeyState : uint32_t { pressed, released };

enum class MouseWheelAxis : uint32_t { vertical, horizontal };

// buttons held down while a pointer event happened
// ------------------------------------------------
struct MouseButtons {
   enum : uint32_t { left = 0x1, right = 0x2, middle = 0x4, ex1 = 0x8, ex2 = 0x10 };

   uint32_t bits = 0;

   bool contains(MouseButton b) const { return bits & flag(b); }

   static constexpr uint32_t flag(MouseButton b) { return 1u << static_cast<uint32_t>(b); }

   // from the `state` field of an X pointer event
   static MouseButtons from_x11_state(unsigned int state) {
      MouseButtons res;
      if (state & Button1Mask)
         res.bits |= left;
      if (state & Button3Mask)
         res.bits |= right;
      if (state & Button2Mask)
         res.bits |= middle;
      return res;
   }

   bool operator==(const MouseButtons&) const = default;
};

static_assert(MouseButtons::flag(MouseButton::middle) == MouseButtons::middle);

struct MouseState {
   PhysicalPosition<int> position;
   MouseButtons          buttons;
};

// X11 keysyms, letters normalized to upper case
// ---------------------------------------------
enum class VirtualKey : uint32_t {
   unknown    = 0,
   A          = XK_A,
   Z          = XK_Z,
   ZERO       = XK_0,
   NINE       = XK_9,
   BACKSPACE  = XK_BackSpace,
   DEL        = XK_Delete,
   DOWN       = XK_Down,
   END        = XK_End,
   ENTER      = XK_Return,
   ESCAPE     = XK_Escape,
   F1         = XK_F1,
   F12        = XK_F12,
   HOME       = XK_Home,
   LEFT       = XK_Left,
   RIGHT      = XK_Right,
   SPACE      = XK_space,
   TAB        = XK_Tab,
   UP         = XK_Up,
   INSERT     = XK_Insert,
   BACKTICK   = XK_grave,
   PAGE_UP    = XK_Page_Up,
   PAGE_DOWN  = XK_Page_Down,
   UNDERSCORE = XK_underscore,
   SHIFT_L    = XK_Shift_L,
   SHIFT_R    = XK_Shift_R,
   CONTROL_L  = XK_Control_L,
   CONTROL_R  = XK_Control_R,
   ALT_L      = XK_Alt_L,
   ALT_R      = XK_Alt_R
};

// keypad aliases fold onto the main keys, as do lower case letters
VirtualKey virtual_key_from_keysym(unsigned long keysym);

struct KeyCode {
   VirtualKey vkey      = VirtualKey::unknown;
   uint32_t   scan_code = 0; // the X keycode

   bool operator==(const KeyCode&) const = default;
};

// ---------------------------------------------------------------------------------------------
//                              hit testing / resizing
// ---------------------------------------------------------------------------------------------
enum class ResizingEdge : uint32_t { left, right, top, bottom, top_left, top_right, bottom_left, bottom_right };

enum class NcHitTestValue : uint32_t {
   client,
   caption,
   left,
   right,
   top,
   bottom,
   top_left,
   top_right,
   bottom_left,
   bottom_right
};

// returns the edge for resize values, std::nullopt for `client` and `caption`
std::optional<ResizingEdge> resizing_edge(NcHitTestValue v);

// ---------------------------------------------------------------------------------------------
//                              event payloads
// ---------------------------------------------------------------------------------------------
struct Draw {
   PhysicalRect<int> invalidate_rect;
};

struct Moved {
   ScreenPosition<int> position;
};

struct Resizing {
   PhysicalSize<int> size;
   ResizingEdge      edge = ResizingEdge::bottom_right;
};

struct Resized {
   PhysicalSize<int> size;
};

struct EnterResizing {};

struct Maximized {
   PhysicalSize<int> size;
};

struct Restored {
   PhysicalSize<int> size;
};

struct Minimized {};

struct CursorEntered {
   MouseState mouse_state;
};

struct CursorLeft {
   MouseState mouse_state;
};

struct CursorMoved {
   MouseState mouse_state;
};

struct MouseInput {
   MouseButton button;
   ButtonState button_state;
   MouseState  mouse_state;
};

struct MouseWheel {
   MouseWheelAxis axis;
   int            distance; // 120 per notch, positive is up / right
   MouseState     mouse_state;
};

struct KeyInput {
   KeyCode  key_code;
   KeyState key_state;
   bool     prev_pressed = false; // true for auto-repeated presses

   bool is(VirtualKey k, KeyState s) const { return key_code.vkey == k && key_state == s; }
};

struct CharInput {
   char32_t c;
};

// Round-trip: the composition window position is requested from the application. Dispatch waits until
// `set_position` or `dismiss` is called, or the value is destroyed (same as `dismiss`).
class ImeBeginComposition {
public:
   ImeBeginComposition(OneShotSender<PhysicalPosition<int>>&& reply)
      : _reply(std::move(reply)) {}

   ImeBeginComposition(ImeBeginComposition&&) noexcept            = default;
   ImeBeginComposition& operator=(ImeBeginComposition&&) noexcept = default;

   void set_position(PhysicalPosition<int> pos) { _reply.send(pos); }
   void dismiss() { _reply.drop(); }
   bool answered() const noexcept { return !_reply.pending(); }

private:
   OneShotSender<PhysicalPosition<int>> _reply;
};

struct ImeClause {
   size_t begin    = 0; // byte offsets into `chars`
   size_t end      = 0;
   bool   targeted = false;

   bool operator==(const ImeClause&) const = default;
};

struct ImeUpdateComposition {
   std::string            chars; // utf-8
   std::vector<ImeClause> clauses;
   size_t                 cursor_position = 0;
};

struct ImeEndComposition {
   std::optional<std::string> result;
};

struct DropFiles {
   std::vector<std::filesystem::path> paths;
   PhysicalPosition<int>              position;
};

// Round-trip: the application decides which part of the window `position` hits. `set` answers,
// `dismiss` (or destroying the value) lets the click proceed as a normal `MouseInput`.
class NcHitTest {
public:
   NcHitTest(PhysicalPosition<int> pos, OneShotSender<NcHitTestValue>&& reply)
      : _position(pos)
      , _reply(std::move(reply)) {}

   NcHitTest(NcHitTest&&) noexcept            = default;
   NcHitTest& operator=(NcHitTest&&) noexcept = default;

   PhysicalPosition<int> position() const { return _position; }

   void set(NcHitTestValue v) { _reply.send(v); }
   void dismiss() { _reply.drop(); }
   bool answered() const noexcept { return !_reply.pending(); }

private:
   PhysicalPosition<int>         _position;
   OneShotSender<NcHitTestValue> _reply;
};

// only sent when the window was built with `auto_close(false)`
struct CloseRequest {
   WindowHandle handle;

   void destroy() const; // posts the native destroy to the UI thread
};

struct Closed {};
struct Activated {};
struct Inactivated {};

struct ContextMenu {
   ScreenPosition<int> position;
};

// application defined event, sequenced through the X event queue
struct App {
   uint32_t index  = 0;
   long     value0 = 0;
   long     value1 = 0;

   bool operator==(const App&) const = default;
};

// any X event without a dedicated alternative
struct Other {
   XEvent raw;
};

using Event = std::variant<Draw, Moved, Resizing, Resized, EnterResizing, Maximized, Restored, Minimized,
                           CursorEntered, CursorLeft, CursorMoved, MouseInput, MouseWheel, KeyInput, CharInput,
                           ImeBeginComposition, ImeUpdateComposition, ImeEndComposition, DropFiles, NcHitTest,
                           CloseRequest, Closed, Activated, Inactivated, ContextMenu, App, Other>;

std::string_view event_name(const Event& ev);

// ---------------------------------------------------------------------------
template <class... Ts>
struct overloaded : Ts... {
   using Ts::operator()...;
};

} // namespace wisp
