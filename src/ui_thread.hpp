#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <X11/Xlib.h>

#include "channel.hpp"
#include "config.hpp"
#include "handle.hpp"
#include "style.hpp"

namespace wisp {

class Procedure;

namespace x11 {
struct Atoms;
class CursorCache;
} // namespace x11

namespace ime {
class XimService;
}

// a closure run on the UI thread
using Task = std::move_only_function<void()>;

// ---------------------------------------------------------------------------------------------
// The single thread which owns the X display connection and runs the event loop.
//
// It starts on first use (or explicitly through `builder().build()`), and stops when the last
// registered window is destroyed or after a fault. Everything touching Xlib or the window
// records runs on it, through `send_task`.
// ---------------------------------------------------------------------------------------------
class UiThread {
public:
   using Hook = std::move_only_function<void()>;

   class Builder {
   public:
      Builder& on_thread_start(Hook f) {
         _on_thread_start = std::move(f);
         return *this;
      }
      Builder& on_main_loop_start(Hook f) {
         _on_main_loop_start = std::move(f);
         return *this;
      }
      Builder& on_main_loop_end(Hook f) {
         _on_main_loop_end = std::move(f);
         return *this;
      }
      // an exception thrown here is rethrown by `join()`
      Builder& on_thread_end(Hook f) {
         _on_thread_end = std::move(f);
         return *this;
      }
      Builder& name(std::string n) {
         _name = std::move(n);
         return *this;
      }

      // Starts the UI thread and waits until it is ready to process tasks. Returns false (and the
      // builder is ignored) if the thread was already started.
      bool build();

   private:
      friend class UiThread;

      Hook                       _on_thread_start;
      Hook                       _on_main_loop_start;
      Hook                       _on_main_loop_end;
      Hook                       _on_thread_end;
      std::optional<std::string> _name;
   };

   static Builder builder() { return {}; }

   // starts the thread with the default hooks, if not started yet
   static void init();

   // Queues `t` and wakes the event loop. Once the thread has finished, `t` is destroyed without
   // being run.
   static void send_task(Task t);

   // Runs `f` on the UI thread. The future holds std::nullopt if the task never ran or threw.
   template <class F>
   static auto call_async(F&& f) -> std::future<std::optional<std::invoke_result_t<F&>>> {
      using R       = std::invoke_result_t<F&>;
      auto [tx, rx] = make_oneshot<R>();
      send_task([f = std::forward<F>(f), tx = std::move(tx)]() mutable { tx.send(f()); });
      return rx.into_future();
   }

   // blocking form of `call_async`; must not be called from the UI thread itself
   template <class F>
   static auto call(F&& f) -> std::optional<std::invoke_result_t<F&>> {
      return call_async(std::forward<F>(f)).get();
   }

   static bool is_finished();
   static bool is_ui_thread();

   // the receiver which rethrows a fault of the UI thread
   static void set_receiver_for_fault(ReceiverId id);

   // runs once, on the UI thread, when the loop ends normally
   static void add_finish_handler(Task f);

   // Waits for the thread to end and returns the loop exit code: 0, or 1 after a fault.
   // Returns 0 if the thread was never started or was already joined.
   static int join();

   // ------------------------------ UI thread only ------------------------------
   static ::Display*        display();
   static ::Window          message_window();
   static const x11::Atoms& atoms();
   static x11::CursorCache& cursors();
   static Procedure&        procedure();
   static ime::XimService&  text_service();
   static const Config&     config();
   static uint32_t          dpi();
   static ColorModeState    system_color_mode();

private:
   static int _run(Builder& b, std::promise<void>& ready);
};

} // namespace wisp
