#include "x11.hpp"
#include "utils.hpp"

#include <X11/Xatom.h>
#include <X11/cursorfont.h>

#include <cmath>
#include <string>
#include <utility>

#include <ctre.hpp>
using namespace ctre::literals;

namespace wisp::x11 {

// ---------------------------------------------------------------------------------------------
void Atoms::intern(::Display* dpy) {
   _atoms[wmProtocolsID]             = XInternAtom(dpy, "WM_PROTOCOLS", 0);
   _atoms[wmDeleteWindowID]          = XInternAtom(dpy, "WM_DELETE_WINDOW", 0);
   _atoms[netWmStateID]              = XInternAtom(dpy, "_NET_WM_STATE", 0);
   _atoms[netWmStateMaximizedHorzID] = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_HORZ", 0);
   _atoms[netWmStateMaximizedVertID] = XInternAtom(dpy, "_NET_WM_STATE_MAXIMIZED_VERT", 0);
   _atoms[netWmMoveResizeID]         = XInternAtom(dpy, "_NET_WM_MOVERESIZE", 0);
   _atoms[netWmIconID]               = XInternAtom(dpy, "_NET_WM_ICON", 0);
   _atoms[netWmNameID]               = XInternAtom(dpy, "_NET_WM_NAME", 0);
   _atoms[utf8StringID]              = XInternAtom(dpy, "UTF8_STRING", 0);
   _atoms[motifWmHintsID]            = XInternAtom(dpy, "_MOTIF_WM_HINTS", 0);
   _atoms[gtkThemeVariantID]         = XInternAtom(dpy, "_GTK_THEME_VARIANT", 0);
   _atoms[primaryID]                 = XInternAtom(dpy, "PRIMARY", 0);
   _atoms[uriListID]                 = XInternAtom(dpy, "text/uri-list", 0);
   _atoms[dndEnterID]                = XInternAtom(dpy, "XdndEnter", 0);
   _atoms[dndPositionID]             = XInternAtom(dpy, "XdndPosition", 0);
   _atoms[dndStatusID]               = XInternAtom(dpy, "XdndStatus", 0);
   _atoms[dndActionCopyID]           = XInternAtom(dpy, "XdndActionCopy", 0);
   _atoms[dndDropID]                 = XInternAtom(dpy, "XdndDrop", 0);
   _atoms[dndSelectionID]            = XInternAtom(dpy, "XdndSelection", 0);
   _atoms[dndFinishedID]             = XInternAtom(dpy, "XdndFinished", 0);
   _atoms[dndAwareID]                = XInternAtom(dpy, "XdndAware", 0);
   _atoms[postTaskID]                = XInternAtom(dpy, "_WISP_POST_TASK", 0);
   _atoms[appEventID]                = XInternAtom(dpy, "_WISP_APP_EVENT", 0);
}

Atoms Atoms::synthetic() {
   Atoms res;
   for (size_t i = 0; i < res._atoms.size(); ++i)
      res._atoms[i] = static_cast<Atom>(1000 + i);
   return res;
}

// ---------------------------------------------------------------------------------------------
static ErrorTrap* g_trap = nullptr;

static int log_x_error(::Display* dpy, XErrorEvent* ev) {
   if (g_trap)
      g_trap->record(ev->error_code);
   char text[256] = {};
   XGetErrorText(dpy, ev->error_code, text, sizeof(text));
   log_warning("X error: {} (request {}, resource {:#x})", text, static_cast<int>(ev->request_code), ev->resourceid);
   return 0;
}

void install_error_handler() { XSetErrorHandler(log_x_error); }

ErrorTrap::ErrorTrap(::Display* dpy)
   : _dpy(dpy)
   , _prev(std::exchange(g_trap, this)) {}

ErrorTrap::~ErrorTrap() {
   if (_dpy)
      XSync(_dpy, False);
   g_trap = _prev;
}

std::optional<unsigned char> ErrorTrap::sync() {
   XSync(_dpy, False);
   return _error;
}

// ---------------------------------------------------------------------------------------------
std::optional<MoveResize> move_resize_for(NcHitTestValue v) {
   switch (v) {
   case NcHitTestValue::client:
      return std::nullopt;
   case NcHitTestValue::caption:
      return MoveResize::move;
   case NcHitTestValue::left:
      return MoveResize::size_left;
   case NcHitTestValue::right:
      return MoveResize::size_right;
   case NcHitTestValue::top:
      return MoveResize::size_top;
   case NcHitTestValue::bottom:
      return MoveResize::size_bottom;
   case NcHitTestValue::top_left:
      return MoveResize::size_topleft;
   case NcHitTestValue::top_right:
      return MoveResize::size_topright;
   case NcHitTestValue::bottom_left:
      return MoveResize::size_bottomleft;
   case NcHitTestValue::bottom_right:
      return MoveResize::size_bottomright;
   }
   return std::nullopt;
}

void send_client_message(::Display* dpy, ::Window target, ::Window about, Atom type, std::array<long, 5> data,
                         long event_mask) {
   XClientMessageEvent m = {};
   m.type                = ClientMessage;
   m.display             = dpy;
   m.window              = about;
   m.message_type        = type;
   m.format              = 32;
   for (size_t i = 0; i < data.size(); ++i)
      m.data.l[i] = data[i];
   XSendEvent(dpy, target, False, event_mask, reinterpret_cast<XEvent*>(&m));
   XFlush(dpy);
}

void start_move_resize(::Display* dpy, const Atoms& atoms, ::Window w, ScreenPosition<int> root_pos, MoveResize dir,
                       unsigned int button) {
   XUngrabPointer(dpy, CurrentTime);
   send_client_message(dpy, DefaultRootWindow(dpy), w, atoms[netWmMoveResizeID],
                       {root_pos.x, root_pos.y, static_cast<long>(dir), static_cast<long>(button), 1},
                       SubstructureRedirectMask | SubstructureNotifyMask);
}

void change_net_wm_state(::Display* dpy, const Atoms& atoms, ::Window w, bool add, Atom a1, Atom a2) {
   send_client_message(dpy, DefaultRootWindow(dpy), w, atoms[netWmStateID],
                       {add ? 1L : 0L, static_cast<long>(a1), static_cast<long>(a2), 1, 0},
                       SubstructureRedirectMask | SubstructureNotifyMask);
}

bool is_maximized(::Display* dpy, const Atoms& atoms, ::Window w) {
   Atom          type   = 0;
   int           format = 0;
   unsigned long count = 0, bytes_left = 0;
   uint8_t*      data = nullptr;
   if (XGetWindowProperty(dpy, w, atoms[netWmStateID], 0, 1024, False, XA_ATOM, &type, &format, &count, &bytes_left,
                          &data) != Success)
      return false;
   bool horz = false, vert = false;
   if (data && format == 32) {
      auto states = reinterpret_cast<Atom*>(data);
      for (unsigned long i = 0; i < count; ++i) {
         horz |= states[i] == atoms[netWmStateMaximizedHorzID];
         vert |= states[i] == atoms[netWmStateMaximizedVertID];
      }
   }
   if (data)
      XFree(data);
   return horz && vert;
}

// ---------------------------------------------------------------------------------------------
void apply_style(::Display* dpy, const Atoms& atoms, ::Window w, const WindowStyle& style, PhysicalSize<int> size) {
   enum : long {
      hints_functions   = 1,
      hints_decorations = 2,
      func_resize       = 2,
      func_move         = 4,
      func_minimize     = 8,
      func_maximize     = 16,
      func_close        = 32,
      decor_border      = 2,
      decor_resizeh     = 4,
      decor_title       = 8,
      decor_menu        = 16,
      decor_minimize    = 32,
      decor_maximize    = 64,
   };

   // format 32 properties are arrays of `long` on the client side
   long hints[5] = {hints_functions | hints_decorations, func_move | func_close, 0, 0, 0};
   if (!style.borderless)
      hints[2] = decor_border | decor_title | decor_menu;
   if (style.resizable) {
      hints[1] |= func_resize;
      if (!style.borderless)
         hints[2] |= decor_resizeh;
   }
   if (style.minimize_box) {
      hints[1] |= func_minimize;
      if (!style.borderless)
         hints[2] |= decor_minimize;
   }
   if (style.maximize_box && style.resizable) {
      hints[1] |= func_maximize;
      if (!style.borderless)
         hints[2] |= decor_maximize;
   }
   XChangeProperty(dpy, w, atoms[motifWmHintsID], atoms[motifWmHintsID], 32, PropModeReplace,
                   reinterpret_cast<uint8_t*>(hints), 5);

   if (!style.resizable) {
      XSizeHints* sh = XAllocSizeHints();
      if (sh) {
         sh->flags      = PMinSize | PMaxSize;
         sh->min_width  = sh->max_width  = size.width;
         sh->min_height = sh->max_height = size.height;
         XSetWMNormalHints(dpy, w, sh);
         XFree(sh);
      }
   }
}

void set_title(::Display* dpy, const Atoms& atoms, ::Window w, std::string_view title) {
   std::string t(title);
   XStoreName(dpy, w, t.c_str());
   XChangeProperty(dpy, w, atoms[netWmNameID], atoms[utf8StringID], 8, PropModeReplace,
                   reinterpret_cast<const uint8_t*>(t.data()), static_cast<int>(t.size()));
}

void set_icon(::Display* dpy, const Atoms& atoms, ::Window w, const Icon& icon) {
   if (!icon.valid()) {
      log_warning("ignoring icon: {}x{} with {} pixels", icon.width, icon.height, icon.argb.size());
      return;
   }
   std::vector<long> data;
   data.reserve(icon.argb.size() + 2);
   data.push_back(icon.width);
   data.push_back(icon.height);
   for (auto px : icon.argb)
      data.push_back(static_cast<long>(px));
   XChangeProperty(dpy, w, atoms[netWmIconID], XA_CARDINAL, 32, PropModeReplace,
                   reinterpret_cast<const uint8_t*>(data.data()), static_cast<int>(data.size()));
}

void set_theme_variant(::Display* dpy, const Atoms& atoms, ::Window w, ColorModeState state) {
   std::string_view v = state == ColorModeState::dark ? "dark" : "light";
   XChangeProperty(dpy, w, atoms[gtkThemeVariantID], atoms[utf8StringID], 8, PropModeReplace,
                   reinterpret_cast<const uint8_t*>(v.data()), static_cast<int>(v.size()));
}

ScreenPosition<int> root_position(::Display* dpy, ::Window w) {
   int      x = 0, y = 0;
   ::Window child = 0;
   XTranslateCoordinates(dpy, w, DefaultRootWindow(dpy), 0, 0, &x, &y, &child);
   return {x, y};
}

// ---------------------------------------------------------------------------------------------
std::optional<uint32_t> parse_xft_dpi(std::string_view resources) {
   if (auto m = ctre::search<R"(Xft\.dpi:\s*([0-9]+)(\.[0-9]*)?)">(resources)) {
      auto dpi = wisp_atoi<uint32_t>(m.get<1>().to_view());
      if (dpi)
         return dpi;
   }
   return std::nullopt;
}

uint32_t query_dpi(::Display* dpy) {
   if (const char* rms = XResourceManagerString(dpy)) {
      if (auto dpi = parse_xft_dpi(rms))
         return *dpi;
   }
   int screen = DefaultScreen(dpy);
   int mm     = DisplayWidthMM(dpy, screen);
   if (mm > 0) {
      auto dpi = static_cast<uint32_t>(std::lround(DisplayWidth(dpy, screen) * 25.4 / mm));
      if (dpi)
         return dpi;
   }
   return default_dpi;
}

static int hex_value(char c) {
   if (c >= '0' && c <= '9')
      return c - '0';
   if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
   if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
   return -1;
}

static std::string percent_decode(std::string_view sv) {
   std::string res;
   res.reserve(sv.size());
   for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '%' && i + 2 < sv.size()) {
         int hi = hex_value(sv[i + 1]), lo = hex_value(sv[i + 2]);
         if (hi >= 0 && lo >= 0) {
            res.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
            continue;
         }
      }
      res.push_back(sv[i]);
   }
   return res;
}

std::vector<std::filesystem::path> parse_uri_list(std::string_view uri_list) {
   std::vector<std::filesystem::path> res;
   while (!uri_list.empty()) {
      auto             eol  = uri_list.find('\n');
      std::string_view line = uri_list.substr(0, eol);
      uri_list              = eol == std::string_view::npos ? std::string_view{} : uri_list.substr(eol + 1);
      if (!line.empty() && line.back() == '\r')
         line.remove_suffix(1);
      if (line.empty() || line[0] == '#')
         continue;
      if (auto m = ctre::match<"file://([^/]*)(/.*)">(line))
         res.emplace_back(percent_decode(m.get<2>().to_view()));
   }
   return res;
}

// ---------------------------------------------------------------------------------------------
unsigned int CursorCache::font_shape(Cursor c) {
   switch (c) {
   case Cursor::arrow:
      return XC_left_ptr;
   case Cursor::hand:
      return XC_hand2;
   case Cursor::ibeam:
      return XC_xterm;
   case Cursor::wait:
      return XC_watch;
   case Cursor::cross:
      return XC_crosshair;
   case Cursor::no:
      return XC_X_cursor;
   case Cursor::size_all:
      return XC_fleur;
   case Cursor::size_ns:
      return XC_sb_v_double_arrow;
   case Cursor::size_we:
      return XC_sb_h_double_arrow;
   case Cursor::size_nesw:
      return XC_bottom_left_corner;
   case Cursor::size_nwse:
      return XC_bottom_right_corner;
   case Cursor::count:
      break;
   }
   return XC_left_ptr;
}

::Cursor CursorCache::get(Cursor c) {
   auto idx = static_cast<size_t>(c);
   if (!_dpy || idx >= _cursors.size())
      return 0;
   if (!_cursors[idx])
      _cursors[idx] = XCreateFontCursor(_dpy, font_shape(c));
   return _cursors[idx];
}

void CursorCache::reset() {
   if (_dpy) {
      for (auto& c : _cursors) {
         if (c)
            XFreeCursor(_dpy, c);
         c = 0;
      }
   }
   _dpy = nullptr;
}

} // namespace wisp::x11
