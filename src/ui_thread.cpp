#include "ui_thread.hpp"
#include "context.hpp"
#include "error.hpp"
#include "ime.hpp"
#include "procedure.hpp"
#include "utils.hpp"
#include "x11.hpp"

#include <X11/XKBlib.h>

#include <atomic>
#include <cstdlib>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace wisp {

namespace {

// ---------------------------------------------------------------------------------------------
// Shared between the UI thread and the posting threads, guarded by `mutex`
// ---------------------------------------------------------------------------------------------
struct Shared {
   std::mutex       mutex;
   std::once_flag   started;
   std::thread      th;
   std::deque<Task> tasks;
   ::Display*       dpy       = nullptr; // valid until `finished` is set
   ::Window         msg_win   = 0;
   Atom             post_atom = 0;
   bool             finished  = false;

   std::atomic<std::thread::id> ui_id;
   std::atomic<int>   exit_code{0};
   std::exception_ptr thread_end_fault; // rethrown by join()
};

Shared& shared() {
   static Shared s;
   return s;
}

// ---------------------------------------------------------------------------------------------
// Owned by the running loop, reachable from tasks through the UiThread accessors
// ---------------------------------------------------------------------------------------------
struct LoopState {
   Config                     config;
   ::Display*                 dpy     = nullptr;
   ::Window                   msg_win = 0;
   x11::Atoms                 atoms;
   x11::CursorCache           cursors;
   ime::XimService            xim;
   std::unique_ptr<Procedure> proc;
   uint32_t                   dpi               = default_dpi;
   ColorModeState             system_color_mode = ColorModeState::light;
   std::vector<Task>          finish_handlers;
};

LoopState* g_loop = nullptr;

LoopState& loop_state() {
   if (!g_loop || std::this_thread::get_id() != shared().ui_id)
      throw Error(ErrorKind::api, "UI thread state accessed outside of the UI thread");
   return *g_loop;
}

// runs a hook, returning the exception it threw
std::exception_ptr run_hook(UiThread::Hook& hook) {
   if (!hook)
      return nullptr;
   try {
      hook();
   } catch (...) {
      return std::current_exception();
   }
   return nullptr;
}

ColorModeState default_color_mode(const Config& cfg) {
   if (cfg.color_mode == ColorMode::dark)
      return ColorModeState::dark;
   if (cfg.color_mode == ColorMode::light)
      return ColorModeState::light;
   const char* theme = std::getenv("GTK_THEME");
   return theme && gtk_theme_is_dark(theme) ? ColorModeState::dark : ColorModeState::light;
}

// no further task is accepted, queued ones are destroyed (which drops their replies)
void stop_accepting_tasks() {
   std::deque<Task> dropped;
   {
      std::lock_guard lock(shared().mutex);
      shared().finished = true;
      shared().dpy      = nullptr;
      shared().msg_win  = 0;
      shared().post_atom = 0;
      dropped.swap(shared().tasks);
   }
   if (!dropped.empty())
      log_debug("dropping {} task(s) queued after the UI thread stopped", dropped.size());
}

} // namespace

// ---------------------------------------------------------------------------------------------
//                              startup
// ---------------------------------------------------------------------------------------------
bool UiThread::Builder::build() {
   bool started = false;
   std::call_once(shared().started, [&] {
      started = true;
      XInitThreads();

      std::promise<void> ready;
      auto               fut = ready.get_future();
      shared().th            = std::thread([b = std::move(*this), ready = std::move(ready)]() mutable {
         shared().exit_code = UiThread::_run(b, ready);
      });
      fut.wait();
   });
   if (!started)
      log_debug("UI thread already started, builder ignored");
   return started;
}

void UiThread::init() { builder().build(); }

int UiThread::_run(Builder& b, std::promise<void>& ready) {
   shared().ui_id = std::this_thread::get_id();
   LoopState st;
   st.config = Config::load();
   set_log_level(st.config.level);
   set_thread_name(b._name.value_or(st.config.thread_name).c_str());

   Context&           ctx = Context::get();
   std::exception_ptr fault;

   auto finish_thread = [&](int code) {
      if (auto e = run_hook(b._on_thread_end))
         shared().thread_end_fault = e;
      return code;
   };

   if (auto e = run_hook(b._on_thread_start)) {
      stop_accepting_tasks();
      ready.set_value();
      ctx.send_fault(e);
      return finish_thread(1);
   }

   // ------------------------------ display ------------------------------
   st.dpy = XOpenDisplay(st.config.display_name.empty() ? nullptr : st.config.display_name.c_str());
   if (!st.dpy) {
      const char* env = std::getenv("DISPLAY");
      log_error("cannot open X display \"{}\"", st.config.display_name.empty() && env ? env : st.config.display_name);
      stop_accepting_tasks();
      ready.set_value();
      ctx.shutdown();
      return finish_thread(1);
   }
   x11::install_error_handler();
   st.atoms.intern(st.dpy);
   st.cursors.init(st.dpy);
   st.dpi               = st.config.dpi ? st.config.dpi : x11::query_dpi(st.dpy);
   st.system_color_mode = default_color_mode(st.config);

   Bool detectable = 0;
   XkbSetDetectableAutoRepeat(st.dpy, 1, &detectable);
   if (!detectable)
      log_info("detectable auto-repeat not supported, repeated keys come as release/press pairs");

   // tasks wake the loop through a ClientMessage to this window
   XSetWindowAttributes attr = {};
   st.msg_win = XCreateWindow(st.dpy, DefaultRootWindow(st.dpy), 0, 0, 1, 1, 0, 0, InputOnly, CopyFromParent, 0, &attr);

   st.proc = std::make_unique<Procedure>(ctx, st.dpy, st.atoms);
   st.xim.init(st.dpy);
   ctx.set_text_service(&st.xim);
   g_loop = &st;
   log_info("UI thread started, dpi {}", st.dpi);

   {
      std::lock_guard lock(shared().mutex);
      shared().dpy       = st.dpy;
      shared().msg_win   = st.msg_win;
      shared().post_atom = st.atoms[x11::postTaskID];
   }

   int code = 0;
   if (auto e = run_hook(b._on_main_loop_start)) {
      fault = e;
      code  = 1;
   }
   ready.set_value();

   // ------------------------------ main loop ------------------------------
   while (!fault) {
      XEvent ev;
      XNextEvent(st.dpy, &ev);

      if (XFilterEvent(&ev, 0)) {
         // consumed by the input method, which may have called our preedit callbacks
         fault = st.proc->take_fault();
         continue;
      }

      if (ev.type == ClientMessage && ev.xclient.window == st.msg_win &&
          ev.xclient.message_type == st.atoms[x11::postTaskID]) {
         std::deque<Task> tasks;
         {
            std::lock_guard lock(shared().mutex);
            tasks.swap(shared().tasks);
         }
         try {
            for (auto& t : tasks)
               t();
         } catch (...) {
            fault = std::current_exception();
         }
      } else {
         st.proc->dispatch(ev);
         fault = st.proc->take_fault();
      }
      if (!fault && st.proc->quit_requested())
         break;
   }

   // ------------------------------ shutdown -----------------------------
   if (!fault) {
      if (auto e = run_hook(b._on_main_loop_end))
         fault = e;
   }
   if (!fault) {
      auto handlers = std::move(st.finish_handlers);
      for (auto& h : handlers) {
         if (auto e = run_hook(h)) {
            fault = e;
            break;
         }
      }
   }

   stop_accepting_tasks();
   if (fault) {
      log_debug("UI thread stopping after a fault");
      ctx.send_fault(fault);
      code = 1;
   } else {
      ctx.shutdown();
   }

   g_loop = nullptr;
   st.proc.reset();
   st.cursors.reset();
   XDestroyWindow(st.dpy, st.msg_win);
   XCloseDisplay(st.dpy);
   log_info("UI thread finished with code {}", code);
   return finish_thread(code);
}

// ---------------------------------------------------------------------------------------------
//                              posting
// ---------------------------------------------------------------------------------------------
void UiThread::send_task(Task t) {
   init();
   auto& s = shared();

   std::unique_lock lock(s.mutex);
   if (s.finished || !s.dpy) {
      lock.unlock();
      log_debug("UI thread finished, task dropped");
      return; // `t` is destroyed here
   }
   s.tasks.push_back(std::move(t));

   // the event is sent through the loop's own connection, which is safe after XInitThreads
   XClientMessageEvent m = {};
   m.type                = ClientMessage;
   m.display             = s.dpy;
   m.window              = s.msg_win;
   m.message_type        = s.post_atom;
   m.format              = 32;
   XSendEvent(s.dpy, s.msg_win, 0, NoEventMask, reinterpret_cast<XEvent*>(&m));
   XFlush(s.dpy);
}

bool UiThread::is_finished() {
   std::lock_guard lock(shared().mutex);
   return shared().finished;
}

bool UiThread::is_ui_thread() { return std::this_thread::get_id() == shared().ui_id; }

void UiThread::set_receiver_for_fault(ReceiverId id) { Context::get().set_fault_receiver(id); }

void UiThread::add_finish_handler(Task f) {
   send_task([f = std::move(f)]() mutable { loop_state().finish_handlers.push_back(std::move(f)); });
}

int UiThread::join() {
   std::thread th;
   {
      std::lock_guard lock(shared().mutex);
      th = std::move(shared().th);
   }
   if (!th.joinable())
      return 0;
   th.join();
   if (auto e = std::exchange(shared().thread_end_fault, nullptr))
      std::rethrow_exception(e);
   return shared().exit_code;
}

// ---------------------------------------------------------------------------------------------
//                              UI thread state
// ---------------------------------------------------------------------------------------------
::Display*        UiThread::display() { return loop_state().dpy; }
::Window          UiThread::message_window() { return loop_state().msg_win; }
const x11::Atoms& UiThread::atoms() { return loop_state().atoms; }
x11::CursorCache& UiThread::cursors() { return loop_state().cursors; }
Procedure&        UiThread::procedure() { return *loop_state().proc; }
ime::XimService&  UiThread::text_service() { return loop_state().xim; }
const Config&     UiThread::config() { return loop_state().config; }
uint32_t          UiThread::dpi() { return loop_state().dpi; }
ColorModeState    UiThread::system_color_mode() { return loop_state().system_color_mode; }

} // namespace wisp
