#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <variant>

#include <X11/Xlib.h>

#include "event.hpp"
#include "geometry.hpp"
#include "handle.hpp"
#include "style.hpp"

namespace wisp {

class EventReceiver;
class AsyncEventReceiver;
class WindowBuilder;
class InnerWindowBuilder;

// escape hatch for embedding the window in another toolkit or a rendering API
struct RawHandle {
   ::Display* display = nullptr;
   ::Window   window  = 0;
};

// ---------------------------------------------------------------------------------------------
// Operations shared by every window kind. Setters are posted to the UI thread and return
// immediately; nothing happens if the window has been closed in the meantime.
// ---------------------------------------------------------------------------------------------
class WindowBase {
public:
   WindowBase() = default;
   explicit WindowBase(WindowHandle h)
      : _handle(h) {}

   WindowHandle handle() const noexcept { return _handle; }
   RawHandle    raw_handle() const;

   void set_position(LogicalPosition<int> pos) const;
   void set_position(PhysicalPosition<int> pos) const;
   void set_inner_size(LogicalSize<int> sz) const;
   void set_inner_size(PhysicalSize<int> sz) const;

   void show() const;
   void hide() const;
   void close() const; // same path as the window manager's close button
   void redraw() const;

   void set_cursor(Cursor c) const;
   void enable_ime() const;
   void disable_ime() const;

   // delivered as `App` through the X event queue, after the events already queued for this window
   void post_app_event(App ev) const;

   bool is_closed() const;

   bool operator==(const WindowBase&) const = default;

protected:
   WindowHandle _handle;
};

// ---------------------------------------------------------------------------------------------
class Window : public WindowBase {
public:
   using WindowBase::WindowBase;

   static WindowBuilder builder(const EventReceiver& rx);

   // blocking queries, std::nullopt once the window (or the UI thread) is gone
   std::optional<ScreenPosition<int>> position() const;
   std::optional<PhysicalSize<int>>   inner_size() const;
   std::optional<uint32_t>            dpi() const;
   std::optional<Cursor>              cursor() const;
   std::optional<ColorMode>           color_mode() const;

   void minimize() const;
   void maximize() const;
   void restore() const;
   void set_title(std::string title) const;
   void set_color_mode(ColorMode mode) const;
};

class AsyncWindow : public WindowBase {
public:
   using WindowBase::WindowBase;

   static WindowBuilder builder(const AsyncEventReceiver& rx);

   std::future<std::optional<ScreenPosition<int>>> position() const;
   std::future<std::optional<PhysicalSize<int>>>   inner_size() const;
   std::future<std::optional<uint32_t>>            dpi() const;
   std::future<std::optional<Cursor>>              cursor() const;
   std::future<std::optional<ColorMode>>           color_mode() const;

   void minimize() const;
   void maximize() const;
   void restore() const;
   void set_title(std::string title) const;
   void set_color_mode(ColorMode mode) const;
};

// ---------------------------------------------------------------------------------------------
// A window embedded in a parent window; positions are relative to the parent
// ---------------------------------------------------------------------------------------------
class InnerWindow : public WindowBase {
public:
   using WindowBase::WindowBase;

   static InnerWindowBuilder builder(const EventReceiver& rx, const WindowBase& parent);

   std::optional<PhysicalPosition<int>> position() const;
   std::optional<PhysicalSize<int>>     inner_size() const;
   std::optional<uint32_t>              dpi() const;
   std::optional<Cursor>                cursor() const;
};

class AsyncInnerWindow : public WindowBase {
public:
   using WindowBase::WindowBase;

   static InnerWindowBuilder builder(const AsyncEventReceiver& rx, const WindowBase& parent);

   std::future<std::optional<PhysicalPosition<int>>> position() const;
   std::future<std::optional<PhysicalSize<int>>>     inner_size() const;
   std::future<std::optional<uint32_t>>              dpi() const;
   std::future<std::optional<Cursor>>                cursor() const;
};

// the value handed back with each event, telling which wrapper type the window was built as
using WindowKind      = std::variant<Window, InnerWindow>;
using AsyncWindowKind = std::variant<AsyncWindow, AsyncInnerWindow>;

AsyncWindowKind to_async(const WindowKind& k);
WindowHandle    handle_of(const WindowKind& k);
WindowHandle    handle_of(const AsyncWindowKind& k);

// ---------------------------------------------------------------------------------------------
//                              builders
// ---------------------------------------------------------------------------------------------
struct WindowConfig {
   std::string                        title = "wisp";
   std::optional<ScreenPosition<int>> position;
   LogicalSize<int>                   inner_size{1024, 768};
   WindowStyle                        style;
   bool                               visible                      = true;
   bool                               enable_ime                   = true;
   bool                               visible_ime_candidate_window = true;
   bool                               accept_drop_files            = false;
   bool                               auto_close                   = true;
   bool                               hook_nc_hittest              = false;
   std::optional<Icon>                icon;
   Cursor                             cursor = Cursor::arrow;
   std::optional<WindowHandle>        parent; // owner window, closed windows cascade to owned ones
   ColorMode                          color_mode = ColorMode::system;
};

class WindowBuilder {
public:
   explicit WindowBuilder(ReceiverId rx)
      : _receiver(rx) {}

   WindowBuilder& title(std::string t) {
      _cfg.title = std::move(t);
      return *this;
   }
   WindowBuilder& position(ScreenPosition<int> p) {
      _cfg.position = p;
      return *this;
   }
   WindowBuilder& inner_size(LogicalSize<int> sz) {
      _cfg.inner_size = sz;
      return *this;
   }
   WindowBuilder& style(WindowStyle s) {
      _cfg.style = s;
      return *this;
   }
   WindowBuilder& visible(bool b) {
      _cfg.visible = b;
      return *this;
   }
   WindowBuilder& enable_ime(bool b) {
      _cfg.enable_ime = b;
      return *this;
   }
   WindowBuilder& visible_ime_candidate_window(bool b) {
      _cfg.visible_ime_candidate_window = b;
      return *this;
   }
   WindowBuilder& accept_drop_files(bool b) {
      _cfg.accept_drop_files = b;
      return *this;
   }
   WindowBuilder& auto_close(bool b) {
      _cfg.auto_close = b;
      return *this;
   }
   WindowBuilder& hook_nc_hittest(bool b) {
      _cfg.hook_nc_hittest = b;
      return *this;
   }
   WindowBuilder& icon(Icon i) {
      _cfg.icon = std::move(i);
      return *this;
   }
   WindowBuilder& cursor(Cursor c) {
      _cfg.cursor = c;
      return *this;
   }
   WindowBuilder& parent(const WindowBase& w) {
      _cfg.parent = w.handle();
      return *this;
   }
   WindowBuilder& color_mode(ColorMode m) {
      _cfg.color_mode = m;
      return *this;
   }

   const WindowConfig& config() const { return _cfg; }

   // throws `wisp::Error` for an invalid configuration, a rejected creation or a closed UI thread
   Window build() const;

   // the future throws the same errors from `get()`
   std::future<AsyncWindow> build_async() const;

private:
   ReceiverId   _receiver;
   WindowConfig _cfg;
};

// ---------------------------------------------------------------------------------------------
struct InnerWindowConfig {
   WindowHandle          parent;
   LogicalPosition<int>  position;
   LogicalSize<int>      size;
   bool                  visible                      = true;
   bool                  enable_ime                   = true;
   bool                  visible_ime_candidate_window = true;
   bool                  accept_drop_files            = false;
   bool                  hook_nc_hittest              = false;
   Cursor                cursor                       = Cursor::arrow;
};

class InnerWindowBuilder {
public:
   InnerWindowBuilder(ReceiverId rx, WindowHandle parent)
      : _receiver(rx) {
      _cfg.parent = parent;
   }

   InnerWindowBuilder& position(LogicalPosition<int> p) {
      _cfg.position = p;
      return *this;
   }
   InnerWindowBuilder& size(LogicalSize<int> sz) {
      _cfg.size = sz;
      return *this;
   }
   InnerWindowBuilder& visible(bool b) {
      _cfg.visible = b;
      return *this;
   }
   InnerWindowBuilder& enable_ime(bool b) {
      _cfg.enable_ime = b;
      return *this;
   }
   InnerWindowBuilder& visible_ime_candidate_window(bool b) {
      _cfg.visible_ime_candidate_window = b;
      return *this;
   }
   InnerWindowBuilder& accept_drop_files(bool b) {
      _cfg.accept_drop_files = b;
      return *this;
   }
   // non-client answers move or resize the top level window
   InnerWindowBuilder& hook_nc_hittest(bool b) {
      _cfg.hook_nc_hittest = b;
      return *this;
   }
   InnerWindowBuilder& cursor(Cursor c) {
      _cfg.cursor = c;
      return *this;
   }

   const InnerWindowConfig& config() const { return _cfg; }

   InnerWindow                   build() const;
   std::future<AsyncInnerWindow> build_async() const;

private:
   ReceiverId        _receiver;
   InnerWindowConfig _cfg;
};

// throws `wisp::Error` (kind `api`) describing the first invalid setting
void validate(const WindowConfig& cfg);
void validate(const InnerWindowConfig& cfg);

} // namespace wisp
