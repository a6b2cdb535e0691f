#include "procedure.hpp"
#include "ime.hpp"
#include "utils.hpp"

#include <X11/Xatom.h>
#include <X11/Xutil.h>

#include <algorithm>

namespace wisp {

// ---------------------------------------------------------------------------------------------
void Procedure::dispatch(XEvent& ev) noexcept {
   guard([&] { _dispatch(ev); });
}

void Procedure::_dispatch(XEvent& ev) {
   switch (ev.type) {
   case Expose:
      _on_expose(ev.xexpose);
      break;
   case ConfigureNotify:
      _on_configure(ev.xconfigure);
      break;
   case MapNotify:
      _on_map(ev.xmap);
      break;
   case UnmapNotify:
      _on_unmap(ev.xunmap);
      break;
   case PropertyNotify:
      _on_property(ev);
      break;
   case FocusIn:
   case FocusOut:
      _on_focus(ev);
      break;
   case MotionNotify:
      _on_motion(ev.xmotion);
      break;
   case EnterNotify:
   case LeaveNotify:
      _on_crossing(ev);
      break;
   case ButtonPress:
   case ButtonRelease:
      _on_button(ev);
      break;
   case KeyPress:
   case KeyRelease:
      _on_key(ev.xkey);
      break;
   case ClientMessage:
      _on_client_message(ev);
      break;
   case SelectionNotify:
      _on_selection(ev.xselection);
      break;
   case DestroyNotify:
      _on_destroy(ev.xdestroywindow);
      break;
   case MappingNotify:
      if (_dpy)
         XRefreshKeyboardMapping(&ev.xmapping);
      _on_other(ev);
      break;
   default:
      _on_other(ev);
      break;
   }
}

// ---------------------------------------------------------------------------------------------
//                              paint / geometry
// ---------------------------------------------------------------------------------------------
void Procedure::_on_expose(const XExposeEvent& e) {
   WindowHandle                     h(e.window);
   PhysicalRect<int>                r({e.x, e.y}, {e.width, e.height});
   std::optional<PhysicalRect<int>> invalidate;

   _ctx.set_window_props(h, [&](WindowProps& p) {
      p.invalidate_rect = p.invalidate_rect.united(r);
      p.redrawing       = true;
      if (e.count == 0) {
         invalidate        = p.invalidate_rect;
         p.invalidate_rect = {};
         p.redrawing       = false;
      }
   });
   if (invalidate)
      _ctx.send_event(h, Draw{*invalidate});
}

void Procedure::_on_configure(const XConfigureEvent& e) {
   WindowHandle h(e.window);
   auto         inner = _ctx.get_window_props(h, [](const WindowProps& p) { return p.inner; });
   if (!inner)
      return;

   // real events are relative to the window manager's frame, synthetic ones (ICCCM 4.1.5) to the root
   ScreenPosition<int> pos{e.x, e.y};
   if (!*inner && !e.send_event && _dpy)
      pos = x11::root_position(_dpy, e.window);
   PhysicalSize<int> size{e.width, e.height};

   bool         moved = false, resized = false, resizing = false;
   ResizingEdge edge = ResizingEdge::bottom_right;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      moved    = wisp_set(p.position, pos);
      resized  = wisp_set(p.size, size);
      resizing = p.resizing;
      edge     = p.resizing_edge;
   });

   if (moved)
      _ctx.send_event(h, Moved{pos});
   if (resized) {
      if (resizing)
         _ctx.send_event(h, Resizing{size, edge});
      else
         _ctx.send_event(h, Resized{size});
   }
}

void Procedure::_on_map(const XMapEvent& e) {
   WindowHandle      h(e.window);
   bool              restored = false;
   PhysicalSize<int> size;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      restored    = std::exchange(p.minimized, false);
      p.hidden    = false;
      size        = p.size;
   });
   if (restored)
      _ctx.send_event(h, Restored{size});
}

// window managers unmap iconified windows (ICCCM 4.1.4)
void Procedure::_on_unmap(const XUnmapEvent& e) {
   WindowHandle h(e.window);
   bool         minimized = false;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      if (!p.hidden && !p.destroying && !p.inner && !p.minimized) {
         p.minimized = true;
         minimized   = true;
      }
   });
   if (minimized)
      _ctx.send_event(h, Minimized{});
}

void Procedure::_on_property(const XEvent& ev) {
   const XPropertyEvent& e = ev.xproperty;
   if (e.atom != _atoms[x11::netWmStateID] || !_dpy) {
      _on_other(ev);
      return;
   }
   WindowHandle      h(e.window);
   bool              max     = x11::is_maximized(_dpy, _atoms, e.window);
   bool              changed = false;
   PhysicalSize<int> size;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      changed = wisp_set(p.maximized, max);
      size    = p.size;
   });
   if (changed && max)
      _ctx.send_event(h, Maximized{size});
   else
      _on_other(ev);
}

void Procedure::_on_focus(const XEvent& ev) {
   const XFocusChangeEvent& e = ev.xfocus;

   // keyboard grabs by other clients are not focus changes
   if (e.mode == NotifyGrab || e.mode == NotifyUngrab || e.detail == NotifyPointer) {
      _on_other(ev);
      return;
   }

   WindowHandle                                      h(e.window);
   bool                                              focused = e.type == FocusIn;
   std::optional<std::shared_ptr<ime::InputContext>> ic;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      p.focused = focused;
      ic        = p.ime_enabled ? p.ime_context : std::shared_ptr<ime::InputContext>{};
   });
   if (!ic)
      return;
   if (*ic && _dpy)
      (*ic)->set_focus(focused);
   _pressed_keys.reset();
   _end_resizing(h);

   if (focused)
      _ctx.send_event(h, Activated{});
   else
      _ctx.send_event(h, Inactivated{});
}

// ---------------------------------------------------------------------------------------------
//                              pointer
// ---------------------------------------------------------------------------------------------
void Procedure::_on_motion(const XMotionEvent& e) {
   WindowHandle h(e.window);
   if (!_ctx.contains(h))
      return;
   _end_resizing(h);

   MouseState ms{{e.x, e.y}, MouseButtons::from_x11_state(e.state)};
   if (!_entered.contains(h)) {
      // one shot leave tracking, reverted when the pointer leaves
      if (_dpy)
         XSelectInput(_dpy, e.window, x11::window_event_mask | LeaveWindowMask);
      _entered.insert(h);
      _ctx.send_event(h, CursorEntered{ms});
   } else {
      _ctx.send_event(h, CursorMoved{ms});
   }
}

void Procedure::_on_crossing(const XEvent& ev) {
   const XCrossingEvent& e = ev.xcrossing;
   WindowHandle          h(e.window);

   // the window manager releasing the grab of a move or resize
   if (e.mode == NotifyUngrab) {
      if (!_end_resizing(h))
         _on_other(ev);
      return;
   }
   if (e.type == LeaveNotify && _entered.erase(h)) {
      if (_dpy)
         XSelectInput(_dpy, e.window, x11::window_event_mask);
      _ctx.send_event(h, CursorLeft{MouseState{{e.x, e.y}, MouseButtons::from_x11_state(e.state)}});
      return;
   }
   _on_other(ev);
}

void Procedure::_on_button(const XEvent& ev) {
   const XButtonEvent& e = ev.xbutton;
   WindowHandle        h(e.window);
   bool                pressed = e.type == ButtonPress;
   MouseState          ms{{e.x, e.y}, MouseButtons::from_x11_state(e.state)};

   _end_resizing(h);

   std::optional<MouseButton> button;
   switch (e.button) {
   case Button1:
      button = MouseButton::left;
      break;
   case Button2:
      button = MouseButton::middle;
      break;
   case Button3:
      button = MouseButton::right;
      break;
   case Button4:
   case Button5:
      if (pressed)
         _ctx.send_event(h, MouseWheel{MouseWheelAxis::vertical, e.button == Button4 ? 120 : -120, ms});
      else
         _on_other(ev);
      return;
   case 6:
   case 7:
      if (pressed)
         _ctx.send_event(h, MouseWheel{MouseWheelAxis::horizontal, e.button == 7 ? 120 : -120, ms});
      else
         _on_other(ev);
      return;
   case 8:
      button = MouseButton::ex1;
      break;
   case 9:
      button = MouseButton::ex2;
      break;
   default:
      _on_other(ev);
      return;
   }

   if (pressed && e.button == Button1 && _nc_hittest(h, e))
      return;

   _ctx.send_event(h, MouseInput{*button, pressed ? ButtonState::pressed : ButtonState::released, ms});
   if (!pressed && e.button == Button3)
      _ctx.send_event(h, ContextMenu{{e.x_root, e.y_root}});
}

// Asks the application which part of the window was clicked. Returns true when the click
// was turned into a window manager move or resize.
bool Procedure::_nc_hittest(WindowHandle h, const XButtonEvent& e) {
   auto hooked = _ctx.get_window_props(h, [](const WindowProps& p) { return p.hook_nc_hittest; });
   if (!hooked || !*hooked)
      return false;

   auto [tx, rx] = make_oneshot<NcHitTestValue>();
   _ctx.send_event(h, NcHitTest({e.x, e.y}, std::move(tx)));

   auto value = rx.wait(); // std::nullopt when the reply was dropped: no preference
   if (!value)
      return false;
   auto dir = x11::move_resize_for(*value);
   if (!dir)
      return false;

   // an inner window drags its top level window
   WindowHandle target = _top_level(h);
   if (auto edge = resizing_edge(*value)) {
      _ctx.set_window_props(target, [&](WindowProps& p) {
         p.resizing      = true;
         p.resizing_edge = *edge;
      });
      _ctx.send_event(target, EnterResizing{});
   }
   if (_dpy)
      x11::start_move_resize(_dpy, _atoms, static_cast<::Window>(target.native()), {e.x_root, e.y_root}, *dir,
                             e.button);
   return true;
}

WindowHandle Procedure::_top_level(WindowHandle h) const {
   while (auto up = _ctx.get_window_props(h, [](const WindowProps& p) { return p.inner ? p.parent : std::nullopt; })) {
      if (!*up)
         break;
      h = **up;
   }
   return h;
}

bool Procedure::_end_resizing(WindowHandle w) {
   auto                             h = _top_level(w);
   std::optional<PhysicalSize<int>> size;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      if (p.resizing) {
         p.resizing = false;
         size       = p.size;
      }
   });
   if (!size)
      return false;
   _ctx.send_event(h, Resized{*size});
   return true;
}

// ---------------------------------------------------------------------------------------------
//                              keyboard
// ---------------------------------------------------------------------------------------------
void Procedure::_on_key(XKeyEvent& e) {
   WindowHandle h(e.window);
   if (!_ctx.contains(h))
      return;

   bool   pressed = e.type == KeyPress;
   KeySym sym     = _dpy ? XLookupKeysym(&e, 0) : NoSymbol;
   auto   code    = e.keycode & 0xFF;
   bool   prev    = _pressed_keys.test(code);
   _pressed_keys.set(code, pressed);

   KeyInput ki{KeyCode{virtual_key_from_keysym(sym), e.keycode}, pressed ? KeyState::pressed : KeyState::released,
               pressed ? prev : true};
   _ctx.send_event(h, std::move(ki));

   if (pressed)
      _char_input(h, e);
}

void Procedure::_char_input(WindowHandle h, XKeyEvent& e) {
   if (!_dpy)
      return;
   auto state = _ctx.get_window_props(h, [](const WindowProps& p) {
      return std::pair{p.ime_enabled ? p.ime_context : std::shared_ptr<ime::InputContext>{}, p.ime_composing};
   });
   if (!state)
      return;
   auto& [ic, composing] = *state;

   std::string text;
   if (ic) {
      char   buff[64];
      KeySym sym    = NoSymbol;
      Status status = 0;
      int    len    = Xutf8LookupString(ic->ic(), &e, buff, sizeof(buff), &sym, &status);
      if (status == XBufferOverflow) {
         text.resize(len);
         len = Xutf8LookupString(ic->ic(), &e, text.data(), len, &sym, &status);
         text.resize(std::max(len, 0));
      } else if (status == XLookupChars || status == XLookupBoth) {
         text.assign(buff, std::max(len, 0));
      }
   } else {
      char buff[64];
      int  len = XLookupString(&e, buff, sizeof(buff), nullptr, nullptr);
      // latin-1
      for (int i = 0; i < len; ++i)
         text += ime::to_utf8(static_cast<char32_t>(static_cast<unsigned char>(buff[i])));
   }
   if (text.empty())
      return;

   if (composing) {
      _ctx.set_window_props(h, [&](WindowProps& p) {
         if (p.ime_commit)
            *p.ime_commit += text;
         else
            p.ime_commit = text;
      });
   }
   for (char32_t c : ime::from_utf8(text))
      _ctx.send_event(h, CharInput{c});
}

// ---------------------------------------------------------------------------------------------
//                              client messages
// ---------------------------------------------------------------------------------------------
void Procedure::_on_client_message(const XEvent& ev) {
   const XClientMessageEvent& e = ev.xclient;
   WindowHandle               h(e.window);

   if (e.message_type == _atoms[x11::wmProtocolsID] &&
       static_cast<Atom>(e.data.l[0]) == _atoms[x11::wmDeleteWindowID]) {
      request_close(h);
   } else if (e.message_type == _atoms[x11::appEventID]) {
      _ctx.send_event(h, App{static_cast<uint32_t>(e.data.l[0]), e.data.l[1], e.data.l[2]});
   } else if (e.message_type == _atoms[x11::dndEnterID]) {
      _dnd_enter(h, e);
   } else if (e.message_type == _atoms[x11::dndPositionID]) {
      _dnd_position(h, e);
   } else if (e.message_type == _atoms[x11::dndDropID]) {
      _dnd_drop(h, e);
   } else {
      _on_other(ev);
   }
}

void Procedure::request_close(WindowHandle h) {
   auto auto_close = _ctx.get_window_props(h, [](const WindowProps& p) { return p.auto_close; });
   if (!auto_close)
      return;
   if (*auto_close)
      destroy_window(h);
   else
      _ctx.send_event(h, CloseRequest{h});
}

void Procedure::destroy_window(WindowHandle h) {
   bool found = _ctx.set_window_props(h, [](WindowProps& p) { p.destroying = true; });
   if (found && _dpy)
      XDestroyWindow(_dpy, h.native());
}

// ---------------------------------------------------------------------------------------------
//                              drag and drop (XDnD)
// ---------------------------------------------------------------------------------------------
void Procedure::_dnd_enter(WindowHandle h, const XClientMessageEvent& e) {
   _ctx.set_window_props(h, [&](WindowProps& p) {
      if (p.accept_drop_files)
         p.drag_source = static_cast<unsigned long>(e.data.l[0]);
   });
}

void Procedure::_dnd_position(WindowHandle h, const XClientMessageEvent& e) {
   auto                  source = static_cast<unsigned long>(e.data.l[0]);
   ScreenPosition<int>   root{static_cast<int>((e.data.l[2] >> 16) & 0xFFFF), static_cast<int>(e.data.l[2] & 0xFFFF)};
   ScreenPosition<int>   origin = _dpy ? x11::root_position(_dpy, e.window) : ScreenPosition<int>{};
   PhysicalPosition<int> pos{root.x - origin.x, root.y - origin.y};

   bool accept = false;
   _ctx.set_window_props(h, [&](WindowProps& p) {
      accept          = p.accept_drop_files;
      p.drop_position = pos;
   });
   if (_dpy && source)
      x11::send_client_message(_dpy, source, source, _atoms[x11::dndStatusID],
                               {static_cast<long>(e.window), accept ? 1L : 0L, 0, 0,
                                accept ? static_cast<long>(_atoms[x11::dndActionCopyID]) : 0L});
}

void Procedure::_dnd_drop(WindowHandle h, const XClientMessageEvent& e) {
   auto source = _ctx.get_window_props(h, [](const WindowProps& p) { return p.drag_source; });
   if (!source)
      return;
   if (!*source) {
      _dnd_finished(h, static_cast<unsigned long>(e.data.l[0]), false);
      return;
   }
   if (_dpy)
      XConvertSelection(_dpy, _atoms[x11::dndSelectionID], _atoms[x11::uriListID], _atoms[x11::primaryID], e.window,
                        static_cast<Time>(e.data.l[2]));
}

void Procedure::_on_selection(const XSelectionEvent& e) {
   WindowHandle h(e.requestor);
   auto         source = _ctx.get_window_props(h, [](const WindowProps& p) { return p.drag_source; });
   if (!source || !*source || !_dpy)
      return;

   std::string uri_list;
   if (e.property != 0 && e.target == _atoms[x11::uriListID]) {
      // read in chunks, offsets are in 32 bit units
      long offset = 0;
      for (;;) {
         Atom          type   = 0;
         int           format = 0;
         unsigned long count = 0, bytes_left = 0;
         uint8_t*      data = nullptr;
         if (XGetWindowProperty(_dpy, e.requestor, _atoms[x11::primaryID], offset, 65536, False, AnyPropertyType,
                                &type, &format, &count, &bytes_left, &data) != Success ||
             !data) {
            log_warning("window {}: cannot read the dropped uri list", h);
            break;
         }
         if (format == 8)
            uri_list.append(reinterpret_cast<const char*>(data), count);
         XFree(data);
         if (format != 8 || bytes_left == 0)
            break;
         offset += static_cast<long>(count / 4);
      }
   }
   drop_uri_list(h, uri_list);
}

void Procedure::drop_uri_list(WindowHandle h, std::string_view uri_list) {
   auto drag = _ctx.get_window_props(h, [](const WindowProps& p) { return std::pair{p.drag_source, p.drop_position}; });
   if (!drag || !drag->first)
      return;
   auto [source, position] = *drag;

   auto paths    = x11::parse_uri_list(uri_list);
   bool accepted = !paths.empty();
   if (accepted)
      _ctx.send_event(h, DropFiles{std::move(paths), position});
   _dnd_finished(h, source, accepted);
}

void Procedure::_dnd_finished(WindowHandle h, unsigned long source, bool accepted) {
   _ctx.set_window_props(h, [](WindowProps& p) { p.drag_source = 0; });
   if (_dpy && source)
      x11::send_client_message(_dpy, source, source, _atoms[x11::dndFinishedID],
                               {static_cast<long>(h.native()), accepted ? 1L : 0L,
                                accepted ? static_cast<long>(_atoms[x11::dndActionCopyID]) : 0L, 0, 0});
}

// ---------------------------------------------------------------------------------------------
//                              destruction
// ---------------------------------------------------------------------------------------------
void Procedure::_on_destroy(const XDestroyWindowEvent& e) {
   WindowHandle h(e.window);
   _ctx.send_event(h, Closed{});

   auto record = _ctx.remove_window(h);
   _entered.erase(h);
   _preedit.erase(h);
   if (!record)
      return;

   // owned windows get a close request, which follows their own close policy
   for (auto child : record->children) {
      if (_ctx.contains(child))
         request_close(child);
   }
   record.reset();

   if (_ctx.is_empty())
      _quit = true;
}

void Procedure::_on_other(const XEvent& ev) {
   _ctx.send_event(WindowHandle(ev.xany.window), Other{ev});
}

// ---------------------------------------------------------------------------------------------
//                              XIM preedit
// ---------------------------------------------------------------------------------------------
void Procedure::on_preedit_start(WindowHandle h) {
   std::shared_ptr<ime::InputContext> ic;
   bool found = _ctx.set_window_props(h, [&](WindowProps& p) {
      p.ime_composing = true;
      p.ime_commit.reset();
      ic = p.ime_context;
   });
   if (!found)
      return;
   _preedit[h] = Preedit{};

   auto [tx, rx] = make_oneshot<PhysicalPosition<int>>();
   _ctx.send_event(h, ImeBeginComposition(std::move(tx)));
   if (auto pos = rx.wait(); pos && ic)
      ic->set_spot(*pos);
}

void Procedure::on_preedit_draw(WindowHandle h, const XIMPreeditDrawCallbackStruct& cs) {
   if (!_ctx.contains(h))
      return;
   auto& pe    = _preedit[h];
   auto  first = std::min<size_t>(std::max(cs.chg_first, 0), pe.text.size());
   auto  len   = std::min<size_t>(std::max(cs.chg_length, 0), pe.text.size() - first);

   const XIMText* t = cs.text;
   if (t && (t->string.multi_byte || (t->encoding_is_wchar && t->string.wide_char))) {
      std::u32string ins;
      if (t->encoding_is_wchar) {
         for (unsigned short i = 0; i < t->length; ++i)
            ins.push_back(static_cast<char32_t>(t->string.wide_char[i]));
      } else {
         ins = ime::from_utf8(t->string.multi_byte);
      }
      std::vector<unsigned long> fb(ins.size(), 0);
      if (t->feedback)
         std::copy_n(t->feedback, std::min<size_t>(t->length, fb.size()), fb.begin());

      pe.text.replace(first, len, ins);
      pe.feedback.erase(pe.feedback.begin() + first, pe.feedback.begin() + first + len);
      pe.feedback.insert(pe.feedback.begin() + first, fb.begin(), fb.end());
   } else if (t && t->feedback) {
      // attributes change only
      for (size_t i = 0; i < t->length && first + i < pe.feedback.size(); ++i)
         pe.feedback[first + i] = t->feedback[i];
   } else {
      pe.text.erase(first, len);
      pe.feedback.erase(pe.feedback.begin() + first, pe.feedback.begin() + first + len);
   }
   pe.caret = std::min<size_t>(std::max(cs.caret, 0), pe.text.size());

   // clauses are runs of equal highlighting, offsets are utf-8 byte offsets
   ImeUpdateComposition update;
   bool                 targeted = false;
   for (size_t i = 0; i < pe.text.size(); ++i) {
      if (i == pe.caret)
         update.cursor_position = update.chars.size();
      bool hl = (pe.feedback[i] & (XIMReverse | XIMHighlight)) != 0;
      if (i == 0 || hl != targeted) {
         if (!update.clauses.empty())
            update.clauses.back().end = update.chars.size();
         update.clauses.push_back(ImeClause{update.chars.size(), update.chars.size(), hl});
         targeted = hl;
      }
      update.chars += ime::to_utf8(pe.text[i]);
   }
   if (!update.clauses.empty())
      update.clauses.back().end = update.chars.size();
   if (pe.caret >= pe.text.size())
      update.cursor_position = update.chars.size();

   _ctx.send_event(h, std::move(update));
}

void Procedure::on_preedit_done(WindowHandle h) {
   std::optional<std::string> result;
   bool                       found = _ctx.set_window_props(h, [&](WindowProps& p) {
      p.ime_composing = false;
      result          = std::exchange(p.ime_commit, std::nullopt);
   });
   _preedit.erase(h);
   if (found)
      _ctx.send_event(h, ImeEndComposition{std::move(result)});
}

} // namespace wisp
