#include "window.hpp"
#include "context.hpp"
#include "error.hpp"
#include "ime.hpp"
#include "procedure.hpp"
#include "receiver.hpp"
#include "ui_thread.hpp"
#include "utils.hpp"
#include "x11.hpp"

#include <X11/Xatom.h>
#include <X11/Xutil.h>

#include <climits>
#include <expected>

namespace wisp {

namespace {

// ---------------------------------------------------------------------------------------------
//                              UI thread plumbing
// ---------------------------------------------------------------------------------------------

// runs `f(dpy, window)` on the UI thread if the window is still registered
template <class F>
void post(WindowHandle h, F&& f) {
   UiThread::send_task([h, f = std::forward<F>(f)]() mutable {
      if (Context::get().contains(h))
         f(UiThread::display(), static_cast<::Window>(h.native()));
   });
}

// same as `post`, handing back the result; std::nullopt when the window (or the UI thread) is gone
template <class R, class F>
std::future<std::optional<R>> query(WindowHandle h, F&& f) {
   auto [tx, rx] = make_oneshot<R>();
   UiThread::send_task([h, f = std::forward<F>(f), tx = std::move(tx)]() mutable {
      if (Context::get().contains(h))
         tx.send(f(UiThread::display(), static_cast<::Window>(h.native())));
   });
   return rx.into_future();
}

template <class R, class F>
std::future<std::optional<R>> query_props(WindowHandle h, F&& f) {
   return query<R>(h, [h, f = std::forward<F>(f)](::Display*, ::Window) mutable {
      return *Context::get().get_window_props(h, f);
   });
}

// ---------------------------------------------------------------------------------------------
std::future<std::optional<ScreenPosition<int>>> screen_position(WindowHandle h) {
   return query<ScreenPosition<int>>(h, [](::Display* dpy, ::Window w) { return x11::root_position(dpy, w); });
}

std::future<std::optional<PhysicalPosition<int>>> parent_position(WindowHandle h) {
   return query<PhysicalPosition<int>>(h, [](::Display* dpy, ::Window w) {
      XWindowAttributes wa = {};
      XGetWindowAttributes(dpy, w, &wa);
      return PhysicalPosition<int>{wa.x, wa.y};
   });
}

std::future<std::optional<PhysicalSize<int>>> inner_size_of(WindowHandle h) {
   return query<PhysicalSize<int>>(h, [](::Display* dpy, ::Window w) {
      XWindowAttributes wa = {};
      XGetWindowAttributes(dpy, w, &wa);
      return PhysicalSize<int>{wa.width, wa.height};
   });
}

std::future<std::optional<uint32_t>> dpi_of(WindowHandle h) {
   return query<uint32_t>(h, [](::Display*, ::Window) { return UiThread::dpi(); });
}

std::future<std::optional<Cursor>> cursor_of(WindowHandle h) {
   return query_props<Cursor>(h, [](const WindowProps& p) { return p.cursor; });
}

std::future<std::optional<ColorMode>> color_mode_of(WindowHandle h) {
   return query_props<ColorMode>(h, [](const WindowProps& p) { return p.color_mode; });
}

// ---------------------------------------------------------------------------------------------
void minimize_window(WindowHandle h) {
   post(h, [](::Display* dpy, ::Window w) { XIconifyWindow(dpy, w, DefaultScreen(dpy)); });
}

void maximize_window(WindowHandle h) {
   post(h, [](::Display* dpy, ::Window w) {
      const auto& atoms = UiThread::atoms();
      x11::change_net_wm_state(dpy, atoms, w, true, atoms[x11::netWmStateMaximizedHorzID],
                               atoms[x11::netWmStateMaximizedVertID]);
   });
}

void restore_window(WindowHandle h) {
   post(h, [h](::Display* dpy, ::Window w) {
      auto minimized = Context::get().get_window_props(h, [](const WindowProps& p) { return p.minimized; });
      if (minimized && *minimized) {
         XMapWindow(dpy, w);
      } else {
         const auto& atoms = UiThread::atoms();
         x11::change_net_wm_state(dpy, atoms, w, false, atoms[x11::netWmStateMaximizedHorzID],
                                  atoms[x11::netWmStateMaximizedVertID]);
      }
   });
}

void set_window_title(WindowHandle h, std::string title) {
   post(h, [title = std::move(title)](::Display* dpy, ::Window w) { x11::set_title(dpy, UiThread::atoms(), w, title); });
}

void set_window_color_mode(WindowHandle h, ColorMode mode) {
   post(h, [h, mode](::Display* dpy, ::Window w) {
      Context::get().set_window_props(h, [&](WindowProps& p) { p.color_mode = mode; });
      x11::set_theme_variant(dpy, UiThread::atoms(), w, resolve_color_mode(mode, UiThread::system_color_mode()));
   });
}

// ---------------------------------------------------------------------------------------------
//                              creation
// ---------------------------------------------------------------------------------------------
using CreateResult = std::expected<WindowHandle, Error>;

bool fits_x11(int v) { return v > 0 && v <= SHRT_MAX; }

// the parts shared by top level and inner windows, after XCreateWindow
WindowProps common_props(::Window w, WindowHandle h, bool enable_ime, bool candidate_window, bool accept_drop_files,
                         Cursor cursor) {
   auto* dpy = UiThread::display();

   WindowProps props;
   props.ime_enabled                  = enable_ime;
   props.visible_ime_candidate_window = candidate_window;
   props.accept_drop_files            = accept_drop_files;
   props.cursor                       = cursor;
   props.ime_context                  = UiThread::text_service().create_context(w, h, UiThread::procedure());

   if (accept_drop_files) {
      Atom version = 5;
      XChangeProperty(dpy, w, UiThread::atoms()[x11::dndAwareID], XA_ATOM, 32, PropModeReplace,
                      reinterpret_cast<const uint8_t*>(&version), 1);
   }
   return props;
}

// registers the window, or destroys it again if that fails
template <class Kind>
WindowHandle register_native(::Window w, WindowProps props, ReceiverId receiver) {
   WindowHandle h(w);
   scoped_guard destroy([&] { XDestroyWindow(UiThread::display(), w); });
   Context::get().register_window(Kind(h), std::move(props), receiver);
   destroy.dismiss();
   return h;
}

WindowHandle create_window(const WindowConfig& cfg, ReceiverId receiver) {
   auto*       dpy   = UiThread::display();
   const auto& atoms = UiThread::atoms();
   auto&       ctx   = Context::get();

   if (!ctx.has_event_channel(receiver))
      throw Error(ErrorKind::api, std::format("event receiver {} is not registered", receiver));
   if (cfg.parent && !ctx.contains(*cfg.parent))
      throw Error(ErrorKind::api, std::format("parent window {} is closed", *cfg.parent));

   // the window manager owns the frame, the requested size is the client area
   auto size = cfg.inner_size.to_physical(UiThread::dpi());
   if (!fits_x11(size.width) || !fits_x11(size.height))
      throw Error(ErrorKind::api, std::format("window size {}x{} out of range", size.width, size.height));
   auto pos = cfg.position.value_or(ScreenPosition<int>{0, 0});

   x11::ErrorTrap trap(dpy);

   XSetWindowAttributes attr = {};
   attr.event_mask           = x11::window_event_mask;
   attr.cursor               = UiThread::cursors().get(cfg.cursor);
   ::Window w = XCreateWindow(dpy, DefaultRootWindow(dpy), pos.x, pos.y, static_cast<unsigned>(size.width),
                              static_cast<unsigned>(size.height), 0, CopyFromParent, InputOutput, CopyFromParent,
                              CWEventMask | CWCursor, &attr);
   if (auto err = trap.sync(); !w || err)
      throw Error(ErrorKind::api, std::format("XCreateWindow failed (error code {})", err.value_or(0)));
   WindowHandle h(w);

   Atom protocols[] = {atoms[x11::wmDeleteWindowID]};
   XSetWMProtocols(dpy, w, protocols, 1);

   XClassHint class_hint{const_cast<char*>("wisp"), const_cast<char*>("wisp")};
   XSetClassHint(dpy, w, &class_hint);

   if (cfg.position) {
      XSizeHints* sh = XAllocSizeHints();
      if (sh) {
         sh->flags = USPosition;
         sh->x     = pos.x;
         sh->y     = pos.y;
         XSetWMNormalHints(dpy, w, sh);
         XFree(sh);
      }
   }
   x11::set_title(dpy, atoms, w, cfg.title);
   x11::apply_style(dpy, atoms, w, cfg.style, size);
   if (cfg.icon)
      x11::set_icon(dpy, atoms, w, *cfg.icon);
   if (cfg.parent)
      XSetTransientForHint(dpy, w, static_cast<::Window>(cfg.parent->native()));
   x11::set_theme_variant(dpy, atoms, w, resolve_color_mode(cfg.color_mode, UiThread::system_color_mode()));

   auto props = common_props(w, h, cfg.enable_ime, cfg.visible_ime_candidate_window, cfg.accept_drop_files,
                             cfg.cursor);
   props.auto_close      = cfg.auto_close;
   props.hook_nc_hittest = cfg.hook_nc_hittest;
   props.parent          = cfg.parent;
   props.color_mode      = cfg.color_mode;
   props.position        = pos;
   props.size            = size;
   props.hidden          = !cfg.visible;

   register_native<Window>(w, std::move(props), receiver);
   if (cfg.visible)
      XMapWindow(dpy, w);
   XFlush(dpy);
   log_debug("window {} created: \"{}\" {}x{}", h, cfg.title, size.width, size.height);
   return h;
}

WindowHandle create_inner_window(const InnerWindowConfig& cfg, ReceiverId receiver) {
   auto* dpy = UiThread::display();
   auto& ctx = Context::get();

   if (!ctx.has_event_channel(receiver))
      throw Error(ErrorKind::api, std::format("event receiver {} is not registered", receiver));
   if (!ctx.contains(cfg.parent))
      throw Error(ErrorKind::api, std::format("parent window {} is closed", cfg.parent));

   auto dpi  = UiThread::dpi();
   auto pos  = cfg.position.to_physical(dpi);
   auto size = cfg.size.to_physical(dpi);
   if (!fits_x11(size.width) || !fits_x11(size.height))
      throw Error(ErrorKind::api, std::format("inner window size {}x{} out of range", size.width, size.height));

   x11::ErrorTrap trap(dpy);

   XSetWindowAttributes attr = {};
   attr.event_mask           = x11::window_event_mask;
   attr.cursor               = UiThread::cursors().get(cfg.cursor);
   ::Window w = XCreateWindow(dpy, static_cast<::Window>(cfg.parent.native()), pos.x, pos.y,
                              static_cast<unsigned>(size.width), static_cast<unsigned>(size.height), 0, CopyFromParent,
                              InputOutput, CopyFromParent, CWEventMask | CWCursor, &attr);
   if (auto err = trap.sync(); !w || err)
      throw Error(ErrorKind::api, std::format("XCreateWindow failed (error code {})", err.value_or(0)));
   WindowHandle h(w);

   auto props = common_props(w, h, cfg.enable_ime, cfg.visible_ime_candidate_window, cfg.accept_drop_files,
                             cfg.cursor);
   props.inner           = true;
   props.parent          = cfg.parent;
   props.hook_nc_hittest = cfg.hook_nc_hittest;
   props.position = {pos.x, pos.y};
   props.size     = size;
   props.hidden   = !cfg.visible;

   register_native<InnerWindow>(w, std::move(props), receiver);
   if (cfg.visible)
      XMapWindow(dpy, w);
   XFlush(dpy);
   log_debug("inner window {} created in {}", h, cfg.parent);
   return h;
}

// posts the creation, errors come back through the reply instead of faulting the UI thread
template <class Config, class Create>
std::future<std::optional<CreateResult>> post_create(const Config& cfg, ReceiverId receiver, Create create) {
   return UiThread::call_async([cfg, receiver, create]() -> CreateResult {
      try {
         return create(cfg, receiver);
      } catch (const Error& e) {
         return std::unexpected(e);
      }
   });
}

WindowHandle creation_result(std::optional<CreateResult> res) {
   if (!res)
      throw Error::ui_thread_closed();
   if (!*res)
      throw res->error();
   return **res;
}

template <class T, class Config, class Create>
T build_sync(const Config& cfg, ReceiverId receiver, Create create) {
   validate(cfg);
   return T(creation_result(post_create(cfg, receiver, create).get()));
}

template <class T, class Config, class Create>
std::future<T> build_deferred(const Config& cfg, ReceiverId receiver, Create create) {
   try {
      validate(cfg);
   } catch (const Error&) {
      std::promise<T> p;
      p.set_exception(std::current_exception());
      return p.get_future();
   }
   return std::async(std::launch::deferred,
                     [fut = post_create(cfg, receiver, create)]() mutable { return T(creation_result(fut.get())); });
}

} // namespace

// ---------------------------------------------------------------------------------------------
//                              validation
// ---------------------------------------------------------------------------------------------
void validate(const WindowConfig& cfg) {
   if (cfg.inner_size.width <= 0 || cfg.inner_size.height <= 0)
      throw Error(ErrorKind::api,
                  std::format("inner size must be positive, got {}x{}", cfg.inner_size.width, cfg.inner_size.height));
   if (cfg.title.find('\0') != std::string::npos)
      throw Error(ErrorKind::api, "window title contains a NUL character");
   if (cfg.icon && !cfg.icon->valid())
      throw Error(ErrorKind::api, std::format("icon has {} pixels for {}x{}", cfg.icon->argb.size(), cfg.icon->width,
                                              cfg.icon->height));
   if (cfg.parent && !cfg.parent->valid())
      throw Error(ErrorKind::api, "invalid parent window handle");
}

void validate(const InnerWindowConfig& cfg) {
   if (!cfg.parent.valid())
      throw Error(ErrorKind::api, "an inner window needs a parent");
   if (cfg.size.width <= 0 || cfg.size.height <= 0)
      throw Error(ErrorKind::api, std::format("size must be positive, got {}x{}", cfg.size.width, cfg.size.height));
}

// ---------------------------------------------------------------------------------------------
//                              builders
// ---------------------------------------------------------------------------------------------
Window WindowBuilder::build() const { return build_sync<Window>(_cfg, _receiver, create_window); }

std::future<AsyncWindow> WindowBuilder::build_async() const {
   return build_deferred<AsyncWindow>(_cfg, _receiver, create_window);
}

InnerWindow InnerWindowBuilder::build() const { return build_sync<InnerWindow>(_cfg, _receiver, create_inner_window); }

std::future<AsyncInnerWindow> InnerWindowBuilder::build_async() const {
   return build_deferred<AsyncInnerWindow>(_cfg, _receiver, create_inner_window);
}

WindowBuilder Window::builder(const EventReceiver& rx) { return WindowBuilder(rx.id()); }
WindowBuilder AsyncWindow::builder(const AsyncEventReceiver& rx) { return WindowBuilder(rx.id()); }

InnerWindowBuilder InnerWindow::builder(const EventReceiver& rx, const WindowBase& parent) {
   return InnerWindowBuilder(rx.id(), parent.handle());
}

InnerWindowBuilder AsyncInnerWindow::builder(const AsyncEventReceiver& rx, const WindowBase& parent) {
   return InnerWindowBuilder(rx.id(), parent.handle());
}

// ---------------------------------------------------------------------------------------------
//                              WindowBase
// ---------------------------------------------------------------------------------------------
RawHandle WindowBase::raw_handle() const {
   if (UiThread::is_ui_thread())
      return RawHandle{UiThread::display(), static_cast<::Window>(_handle.native())};
   auto dpy = UiThread::call([] { return UiThread::display(); });
   return RawHandle{dpy.value_or(nullptr), static_cast<::Window>(_handle.native())};
}

void WindowBase::set_position(LogicalPosition<int> pos) const {
   post(_handle, [pos](::Display* dpy, ::Window w) {
      auto p = pos.to_physical(UiThread::dpi());
      XMoveWindow(dpy, w, p.x, p.y);
   });
}

void WindowBase::set_position(PhysicalPosition<int> pos) const {
   post(_handle, [pos](::Display* dpy, ::Window w) { XMoveWindow(dpy, w, pos.x, pos.y); });
}

void WindowBase::set_inner_size(LogicalSize<int> sz) const {
   post(_handle, [sz](::Display* dpy, ::Window w) {
      auto s = sz.to_physical(UiThread::dpi());
      if (fits_x11(s.width) && fits_x11(s.height))
         XResizeWindow(dpy, w, static_cast<unsigned>(s.width), static_cast<unsigned>(s.height));
      else
         log_warning("ignoring window size {}x{}", s.width, s.height);
   });
}

void WindowBase::set_inner_size(PhysicalSize<int> sz) const {
   post(_handle, [sz](::Display* dpy, ::Window w) {
      if (fits_x11(sz.width) && fits_x11(sz.height))
         XResizeWindow(dpy, w, static_cast<unsigned>(sz.width), static_cast<unsigned>(sz.height));
      else
         log_warning("ignoring window size {}x{}", sz.width, sz.height);
   });
}

void WindowBase::show() const {
   post(_handle, [h = _handle](::Display* dpy, ::Window w) {
      Context::get().set_window_props(h, [](WindowProps& p) { p.hidden = false; });
      XMapWindow(dpy, w);
   });
}

void WindowBase::hide() const {
   post(_handle, [h = _handle](::Display* dpy, ::Window w) {
      bool inner = false;
      Context::get().set_window_props(h, [&](WindowProps& p) {
         p.hidden = true;
         inner    = p.inner;
      });
      // top level windows are withdrawn so the window manager forgets them (ICCCM 4.1.4)
      if (inner)
         XUnmapWindow(dpy, w);
      else
         XWithdrawWindow(dpy, w, DefaultScreen(dpy));
   });
}

void WindowBase::close() const {
   post(_handle, [](::Display* dpy, ::Window w) {
      const auto& atoms = UiThread::atoms();
      x11::send_client_message(dpy, w, w, atoms[x11::wmProtocolsID],
                               {static_cast<long>(atoms[x11::wmDeleteWindowID]), CurrentTime, 0, 0, 0});
   });
}

void WindowBase::redraw() const {
   post(_handle, [h = _handle](::Display* dpy, ::Window w) {
      auto pending = Context::get().get_window_props(h, [](const WindowProps& p) { return p.redrawing; });
      if (pending && !*pending) {
         XClearArea(dpy, w, 0, 0, 0, 0, True);
         XFlush(dpy);
      }
   });
}

void WindowBase::set_cursor(Cursor c) const {
   post(_handle, [h = _handle, c](::Display* dpy, ::Window w) {
      Context::get().set_window_props(h, [c](WindowProps& p) { p.cursor = c; });
      XDefineCursor(dpy, w, UiThread::cursors().get(c));
      XFlush(dpy);
   });
}

void WindowBase::enable_ime() const {
   post(_handle, [h = _handle](::Display*, ::Window) {
      std::shared_ptr<ime::InputContext> ic;
      Context::get().set_window_props(h, [&](WindowProps& p) {
         p.ime_enabled = true;
         if (p.focused)
            ic = p.ime_context;
      });
      // `disable_ime` took the focus away from the input context
      if (ic)
         ic->set_focus(true);
   });
}

void WindowBase::disable_ime() const {
   post(_handle, [h = _handle](::Display*, ::Window) {
      std::shared_ptr<ime::InputContext> ic;
      Context::get().set_window_props(h, [&](WindowProps& p) {
         p.ime_enabled = false;
         ic            = p.ime_context;
      });
      if (ic) {
         ic->reset();
         ic->set_focus(false);
      }
   });
}

void WindowBase::post_app_event(App ev) const {
   post(_handle, [ev](::Display* dpy, ::Window w) {
      x11::send_client_message(dpy, w, w, UiThread::atoms()[x11::appEventID],
                               {static_cast<long>(ev.index), ev.value0, ev.value1, 0, 0});
   });
}

bool WindowBase::is_closed() const { return !Context::get().contains(_handle); }

// ---------------------------------------------------------------------------------------------
//                              Window / AsyncWindow
// ---------------------------------------------------------------------------------------------
std::optional<ScreenPosition<int>> Window::position() const { return screen_position(_handle).get(); }
std::optional<PhysicalSize<int>>   Window::inner_size() const { return inner_size_of(_handle).get(); }
std::optional<uint32_t>            Window::dpi() const { return dpi_of(_handle).get(); }
std::optional<Cursor>              Window::cursor() const { return cursor_of(_handle).get(); }
std::optional<ColorMode>           Window::color_mode() const { return color_mode_of(_handle).get(); }

void Window::minimize() const { minimize_window(_handle); }
void Window::maximize() const { maximize_window(_handle); }
void Window::restore() const { restore_window(_handle); }
void Window::set_title(std::string title) const { set_window_title(_handle, std::move(title)); }
void Window::set_color_mode(ColorMode mode) const { set_window_color_mode(_handle, mode); }

std::future<std::optional<ScreenPosition<int>>> AsyncWindow::position() const { return screen_position(_handle); }
std::future<std::optional<PhysicalSize<int>>>   AsyncWindow::inner_size() const { return inner_size_of(_handle); }
std::future<std::optional<uint32_t>>            AsyncWindow::dpi() const { return dpi_of(_handle); }
std::future<std::optional<Cursor>>              AsyncWindow::cursor() const { return cursor_of(_handle); }
std::future<std::optional<ColorMode>>           AsyncWindow::color_mode() const { return color_mode_of(_handle); }

void AsyncWindow::minimize() const { minimize_window(_handle); }
void AsyncWindow::maximize() const { maximize_window(_handle); }
void AsyncWindow::restore() const { restore_window(_handle); }
void AsyncWindow::set_title(std::string title) const { set_window_title(_handle, std::move(title)); }
void AsyncWindow::set_color_mode(ColorMode mode) const { set_window_color_mode(_handle, mode); }

// ---------------------------------------------------------------------------------------------
//                              InnerWindow / AsyncInnerWindow
// ---------------------------------------------------------------------------------------------
std::optional<PhysicalPosition<int>> InnerWindow::position() const { return parent_position(_handle).get(); }
std::optional<PhysicalSize<int>>     InnerWindow::inner_size() const { return inner_size_of(_handle).get(); }
std::optional<uint32_t>              InnerWindow::dpi() const { return dpi_of(_handle).get(); }
std::optional<Cursor>                InnerWindow::cursor() const { return cursor_of(_handle).get(); }

std::future<std::optional<PhysicalPosition<int>>> AsyncInnerWindow::position() const {
   return parent_position(_handle);
}
std::future<std::optional<PhysicalSize<int>>> AsyncInnerWindow::inner_size() const { return inner_size_of(_handle); }
std::future<std::optional<uint32_t>>          AsyncInnerWindow::dpi() const { return dpi_of(_handle); }
std::future<std::optional<Cursor>>            AsyncInnerWindow::cursor() const { return cursor_of(_handle); }

// ---------------------------------------------------------------------------------------------
AsyncWindowKind to_async(const WindowKind& k) {
   return std::visit(overloaded{[](const Window& w) -> AsyncWindowKind { return AsyncWindow(w.handle()); },
                                [](const InnerWindow& w) -> AsyncWindowKind { return AsyncInnerWindow(w.handle()); }},
                     k);
}

WindowHandle handle_of(const WindowKind& k) {
   return std::visit([](const auto& w) { return w.handle(); }, k);
}

WindowHandle handle_of(const AsyncWindowKind& k) {
   return std::visit([](const auto& w) { return w.handle(); }, k);
}

} // namespace wisp
