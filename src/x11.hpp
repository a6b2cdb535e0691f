#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "event.hpp"
#include "geometry.hpp"
#include "style.hpp"

// ---------------------------------------------------------------------------------------------
//                              Xlib helpers shared by the UI thread, dispatch and windows
// ---------------------------------------------------------------------------------------------
namespace wisp::x11 {

enum atom_id_t {
   wmProtocolsID = 0,
   wmDeleteWindowID,
   netWmStateID,
   netWmStateMaximizedHorzID,
   netWmStateMaximizedVertID,
   netWmMoveResizeID,
   netWmIconID,
   netWmNameID,
   utf8StringID,
   motifWmHintsID,
   gtkThemeVariantID,
   primaryID,
   uriListID,
   dndEnterID,
   dndPositionID,
   dndStatusID,
   dndActionCopyID,
   dndDropID,
   dndSelectionID,
   dndFinishedID,
   dndAwareID,
   postTaskID,
   appEventID,
   atom_id_last
};

struct Atoms {
   std::array<Atom, atom_id_last> _atoms{};

   Atom operator[](atom_id_t id) const { return _atoms[id]; }

   void intern(::Display* dpy);

   // distinct non-zero values, for driving dispatch without an X server
   static Atoms synthetic();
};

// events selected on every window. LeaveWindowMask is added while the pointer is inside.
inline constexpr long window_event_mask = ExposureMask | PointerMotionMask | ButtonPressMask | ButtonReleaseMask |
                                          KeyPressMask | KeyReleaseMask | StructureNotifyMask | EnterWindowMask |
                                          FocusChangeMask | PropertyChangeMask;

// replaces Xlib's default handler, which exits the process
void install_error_handler();

// Collects the protocol errors raised by the requests issued while it is alive (UI thread only).
class ErrorTrap {
public:
   explicit ErrorTrap(::Display* dpy);
   ~ErrorTrap();

   ErrorTrap(const ErrorTrap&)            = delete;
   ErrorTrap& operator=(const ErrorTrap&) = delete;

   // waits for the server to process the requests so far, returns the first error code
   std::optional<unsigned char> sync();

   void record(unsigned char code) {
      if (!_error)
         _error = code;
   }

private:
   ::Display*                   _dpy;
   ErrorTrap*                   _prev;
   std::optional<unsigned char> _error;
};

// _NET_WM_MOVERESIZE directions
// -----------------------------
enum class MoveResize : long {
   size_topleft     = 0,
   size_top         = 1,
   size_topright    = 2,
   size_right       = 3,
   size_bottomright = 4,
   size_bottom      = 5,
   size_bottomleft  = 6,
   size_left        = 7,
   move             = 8,
};

// std::nullopt for `client`, which is handled like a normal click
std::optional<MoveResize> move_resize_for(NcHitTestValue v);

// hands the pointer grab over to the window manager, which moves or resizes the window
void start_move_resize(::Display* dpy, const Atoms& atoms, ::Window w, ScreenPosition<int> root_pos, MoveResize dir,
                       unsigned int button);

void send_client_message(::Display* dpy, ::Window target, ::Window about, Atom type, std::array<long, 5> data,
                         long event_mask = NoEventMask);

// adds or removes up to two _NET_WM_STATE atoms through the window manager
void change_net_wm_state(::Display* dpy, const Atoms& atoms, ::Window w, bool add, Atom a1, Atom a2 = 0);

bool is_maximized(::Display* dpy, const Atoms& atoms, ::Window w);

void apply_style(::Display* dpy, const Atoms& atoms, ::Window w, const WindowStyle& style, PhysicalSize<int> size);

void set_title(::Display* dpy, const Atoms& atoms, ::Window w, std::string_view title);

void set_icon(::Display* dpy, const Atoms& atoms, ::Window w, const Icon& icon);

void set_theme_variant(::Display* dpy, const Atoms& atoms, ::Window w, ColorModeState state);

ScreenPosition<int> root_position(::Display* dpy, ::Window w);

// DPI from the `Xft.dpi` resource, else from the screen dimensions, else 96
uint32_t query_dpi(::Display* dpy);

std::optional<uint32_t> parse_xft_dpi(std::string_view resources);

// `file://` entries of a text/uri-list, percent decoded
std::vector<std::filesystem::path> parse_uri_list(std::string_view uri_list);

// ---------------------------------------------------------------------------------------------
class CursorCache {
public:
   CursorCache() = default;
   CursorCache(const CursorCache&)            = delete;
   CursorCache& operator=(const CursorCache&) = delete;
   ~CursorCache() { reset(); }

   void     init(::Display* dpy) { _dpy = dpy; }
   ::Cursor get(Cursor c);
   void     reset();

   static unsigned int font_shape(Cursor c);

private:
   ::Display*                                          _dpy = nullptr;
   std::array<::Cursor, static_cast<size_t>(Cursor::count)> _cursors{};
};

} // namespace wisp::x11
