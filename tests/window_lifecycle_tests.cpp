#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <error.hpp>
#include <receiver.hpp>
#include <ui_thread.hpp>
#include <window.hpp>

#include <X11/Xlib.h>

#include <set>

namespace {

bool have_display() {
   XInitThreads();
   ::Display* dpy = XOpenDisplay(nullptr);
   if (!dpy)
      return false;
   XCloseDisplay(dpy);
   return true;
}

} // namespace

TEST_CASE("invalid configurations are rejected before reaching the UI thread") {
   wisp::EventReceiver rx;

   CHECK_THROWS_AS(wisp::Window::builder(rx).inner_size({0, 100}).build(), wisp::Error);
   CHECK_THROWS_AS(wisp::Window::builder(rx).title(std::string("a\0b", 3)).build(), wisp::Error);

   wisp::Icon bad{2, 2, {0xFF000000}};
   CHECK_THROWS_AS(wisp::Window::builder(rx).icon(bad).build(), wisp::Error);

   auto fut = wisp::Window::builder(rx).inner_size({-1, 10}).build_async();
   try {
      fut.get();
      FAIL("build_async accepted a negative size");
   } catch (const wisp::Error& e) {
      CHECK(e.kind() == wisp::ErrorKind::api);
   }

   CHECK_THROWS_AS(wisp::InnerWindowBuilder(rx.id(), wisp::WindowHandle()).size({1, 1}).build(), wisp::Error);
   CHECK(!wisp::UiThread::is_finished());
}

TEST_CASE("windows live until closed, then the UI thread stops") {
   if (!have_display()) {
      MESSAGE("no X display, skipped");
      return;
   }

   wisp::EventReceiver rx;
   auto                w = wisp::Window::builder(rx).title("lifecycle").inner_size({320, 240}).build();
   CHECK(!w.is_closed());

   auto dpi = w.dpi();
   REQUIRE(dpi.has_value());
   CHECK(w.inner_size() == wisp::LogicalSize<int>{320, 240}.to_physical(*dpi));

   auto raw = w.raw_handle();
   CHECK(raw.display != nullptr);
   CHECK(raw.window == w.handle().native());

   // also from a task, where it must not wait for the UI thread
   auto from_task = wisp::UiThread::call([&] { return w.raw_handle(); });
   REQUIRE(from_task.has_value());
   CHECK(from_task->display == raw.display);

   // the IME can be turned off and on again
   w.disable_ime();
   w.enable_ime();

   w.set_cursor(wisp::Cursor::hand);
   CHECK(w.cursor() == wisp::Cursor::hand);
   w.set_color_mode(wisp::ColorMode::dark);
   CHECK(w.color_mode() == wisp::ColorMode::dark);

   auto inner = wisp::InnerWindow::builder(rx, w).position({10, 10}).size({50, 50}).build();
   CHECK(inner.position() == wisp::LogicalPosition<int>{10, 10}.to_physical(*dpi));

   auto owned = wisp::Window::builder(rx).title("owned").inner_size({100, 100}).parent(w).auto_close(false).build();

   // a parent that does not exist
   CHECK_THROWS_AS(wisp::Window::builder(rx).parent(wisp::Window(wisp::WindowHandle(0x7ffffff0))).build(),
                   wisp::Error);

   w.close();

   std::set<wisp::WindowHandle> closed;
   while (auto ev = rx.recv()) {
      auto& [event, window] = *ev;
      if (std::holds_alternative<wisp::Closed>(event))
         closed.insert(wisp::handle_of(window));
      else if (auto* req = std::get_if<wisp::CloseRequest>(&event)) {
         CHECK(req->handle == owned.handle());
         req->destroy();
      }
   }

   CHECK(closed == std::set{w.handle(), inner.handle(), owned.handle()});
   CHECK(w.is_closed());
   CHECK(!w.inner_size());
   CHECK(wisp::UiThread::join() == 0);
   CHECK(wisp::UiThread::join() == 0);
   CHECK(wisp::UiThread::is_finished());

   try {
      wisp::Window::builder(rx).build();
      FAIL("a window was built after shutdown");
   } catch (const wisp::Error& e) {
      CHECK(e.kind() == wisp::ErrorKind::ui_thread_closed);
   }

   wisp::EventReceiver late;
   CHECK(!late.recv());
}
