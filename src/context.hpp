#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "channel.hpp"
#include "event.hpp"
#include "handle.hpp"
#include "style.hpp"
#include "window.hpp"

namespace wisp {

namespace ime {
class InputContext;
class TextService;
} // namespace ime

// ---------------------------------------------------------------------------------------------
// What a receiver gets: an event with the window it belongs to, or a fault from the UI thread
// ---------------------------------------------------------------------------------------------
struct EventItem {
   Event      event;
   WindowKind window;
};

using RecvElement = std::variant<EventItem, std::exception_ptr>;
using EventSender = Sender<RecvElement>;

// ---------------------------------------------------------------------------------------------
// Per window state, written by dispatch and by the public API (through UI thread tasks)
// ---------------------------------------------------------------------------------------------
struct WindowProps {
   // configuration
   // -------------
   std::shared_ptr<ime::InputContext> ime_context;
   bool                               ime_enabled                  = true;
   bool                               visible_ime_candidate_window = true;
   bool                               auto_close                   = true;
   bool                               hook_nc_hittest              = false;
   bool                               accept_drop_files            = false;
   Cursor                             cursor                       = Cursor::arrow;
   std::optional<WindowHandle>        parent;
   ColorMode                          color_mode = ColorMode::system;
   bool                               inner      = false; // embedded in a parent, positions are parent relative

   // dispatch state
   // --------------
   bool                redrawing  = false; // an Expose series is pending
   bool                resizing   = false; // a resize drag we started is in progress
   bool                focused    = false;
   bool                minimized  = false;
   bool                maximized  = false;
   bool                hidden     = false; // unmapped through `hide()`, not a minimize
   bool                destroying = false; // XDestroyWindow issued, the coming unmap is not a minimize
   ResizingEdge        resizing_edge = ResizingEdge::bottom_right;
   PhysicalRect<int>   invalidate_rect;    // union of the current Expose series
   ScreenPosition<int> position;
   PhysicalSize<int>   size;

   // drag and drop
   // -------------
   unsigned long         drag_source = 0;
   PhysicalPosition<int> drop_position;

   // ime composition
   // ---------------
   bool                       ime_composing = false;
   std::optional<std::string> ime_commit;
};

struct WindowRecord {
   WindowKind                kind;
   EventSender               event_tx;
   WindowProps               props;
   std::vector<WindowHandle> children;
};

// ---------------------------------------------------------------------------------------------
// Registry of live windows and event receivers.
//
// The window map and the channel map have their own mutex; no method holds both. Property
// accessors run their callback under the window lock, so the callback must not call back into
// the Context.
// ---------------------------------------------------------------------------------------------
class Context {
public:
   Context() = default;
   Context(const Context&)            = delete;
   Context& operator=(const Context&) = delete;

   // process-wide instance, created on first use
   static Context& get();

   // ------------------------------ receivers ------------------------------
   void register_event_channel(ReceiverId id, EventSender tx);
   void unregister_event_channel(ReceiverId id);
   bool has_event_channel(ReceiverId id) const;
   void set_fault_receiver(ReceiverId id);

   // ------------------------------ windows --------------------------------
   // throws `wisp::Error` (kind `api`) when `receiver` was never registered
   WindowHandle register_window(WindowKind kind, WindowProps props, ReceiverId receiver);

   // the caller posts a close request to the returned children
   std::optional<WindowRecord> remove_window(WindowHandle h);

   bool   contains(WindowHandle h) const;
   bool   is_empty() const;
   size_t window_count() const;

   std::optional<std::vector<WindowHandle>> children(WindowHandle h) const;

   template <class F>
   auto get_window_props(WindowHandle h, F&& f) const -> std::optional<std::invoke_result_t<F, const WindowProps&>> {
      std::lock_guard lock(_windows_mutex);
      auto            it = _windows.find(h);
      if (it == _windows.end())
         return std::nullopt;
      return std::invoke(std::forward<F>(f), std::as_const(it->second.props));
   }

   // returns false if the window is not registered
   template <class F>
   bool set_window_props(WindowHandle h, F&& f) {
      std::lock_guard lock(_windows_mutex);
      auto            it = _windows.find(h);
      if (it == _windows.end())
         return false;
      std::invoke(std::forward<F>(f), it->second.props);
      return true;
   }

   // dropped silently when the window is gone
   void send_event(WindowHandle h, Event ev);

   // sends `Closed` to every live window
   void close_all_windows();

   // ------------------------------ lifecycle ------------------------------
   // closes all windows, shuts down the text service, then hands the fault to the designated
   // receiver and clears every channel
   void send_fault(std::exception_ptr fault);

   // drops every window record and channel, receivers then see a disconnected channel
   void shutdown();

   void set_text_service(ime::TextService* ts) { _text_service = ts; }

private:
   void shutdown_text_service();

   mutable std::mutex                            _windows_mutex;
   std::unordered_map<WindowHandle, WindowRecord> _windows;

   mutable std::mutex                          _channels_mutex;
   std::unordered_map<ReceiverId, EventSender> _channels;
   std::optional<ReceiverId>                   _fault_receiver;

   std::atomic<ime::TextService*> _text_service{nullptr};
};

} // namespace wisp
