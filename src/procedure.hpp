#pragma once

#include <bitset>
#include <exception>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <X11/Xlib.h>

#include "context.hpp"
#include "event.hpp"
#include "handle.hpp"
#include "x11.hpp"

namespace wisp {

// ---------------------------------------------------------------------------------------------
// Turns X events into `Event`s for the registered windows.
//
// Runs on the UI thread only. `dispatch` never throws: a fault is kept until the loop collects
// it with `take_fault`. With a null display, requests to the X server (keysym lookups, pointer
// tracking, window destruction, drag and drop replies) are skipped, everything else behaves the same.
// ---------------------------------------------------------------------------------------------
class Procedure {
public:
   Procedure(Context& ctx, ::Display* dpy, const x11::Atoms& atoms)
      : _ctx(ctx)
      , _dpy(dpy)
      , _atoms(atoms) {}

   Procedure(const Procedure&)            = delete;
   Procedure& operator=(const Procedure&) = delete;

   void dispatch(XEvent& ev) noexcept;

   // runs `f`, capturing an escaping exception (the first one wins)
   template <class F>
   void guard(F&& f) noexcept {
      try {
         f();
      } catch (...) {
         if (!_fault)
            _fault = std::current_exception();
      }
   }

   std::exception_ptr take_fault() noexcept { return std::exchange(_fault, nullptr); }
   bool               has_fault() const noexcept { return !!_fault; }

   // set once the last registered window was destroyed
   bool quit_requested() const noexcept { return _quit; }

   // the close button policy: destroy the window, or let the application decide
   void request_close(WindowHandle h);

   // XDestroyWindow, marking the window so its final unmap is not reported as a minimize
   void destroy_window(WindowHandle h);

   // the end of an XDnD drop: `DropFiles` for the `file://` entries, then XdndFinished
   void drop_uri_list(WindowHandle h, std::string_view uri_list);

   // ------------------------------ XIM preedit callbacks -------------------------
   void on_preedit_start(WindowHandle h);
   void on_preedit_draw(WindowHandle h, const XIMPreeditDrawCallbackStruct& cs);
   void on_preedit_done(WindowHandle h);

private:
   void _dispatch(XEvent& ev);

   void _on_expose(const XExposeEvent& e);
   void _on_configure(const XConfigureEvent& e);
   void _on_map(const XMapEvent& e);
   void _on_unmap(const XUnmapEvent& e);
   void _on_property(const XEvent& ev);
   void _on_focus(const XEvent& ev);
   void _on_motion(const XMotionEvent& e);
   void _on_crossing(const XEvent& ev);
   void _on_button(const XEvent& ev);
   void _on_key(XKeyEvent& e);
   void _on_client_message(const XEvent& ev);
   void _on_selection(const XSelectionEvent& e);
   void _on_destroy(const XDestroyWindowEvent& e);
   void _on_other(const XEvent& ev);

   bool _nc_hittest(WindowHandle h, const XButtonEvent& e);
   WindowHandle _top_level(WindowHandle h) const;
   bool         _end_resizing(WindowHandle w); // true when a `Resized` was sent
   void _char_input(WindowHandle h, XKeyEvent& e);

   void _dnd_enter(WindowHandle h, const XClientMessageEvent& e);
   void _dnd_position(WindowHandle h, const XClientMessageEvent& e);
   void _dnd_drop(WindowHandle h, const XClientMessageEvent& e);
   void _dnd_finished(WindowHandle h, unsigned long source, bool accepted);

   struct Preedit {
      std::u32string             text;
      std::vector<unsigned long> feedback;
      size_t                     caret = 0;
   };

   Context&           _ctx;
   ::Display*         _dpy;
   const x11::Atoms&  _atoms;
   std::exception_ptr _fault;
   bool               _quit = false;

   std::unordered_set<WindowHandle>          _entered;      // windows with leave tracking armed
   std::bitset<256>                          _pressed_keys; // by X keycode, for auto-repeat detection
   std::unordered_map<WindowHandle, Preedit> _preedit;
};

} // namespace wisp
