#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <receiver.hpp>
#include <ui_thread.hpp>
#include <window.hpp>

#include <X11/Xlib.h>

#include <vector>

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

TEST_CASE("application events arrive in order with their values") {
   if (!have_display()) {
      MESSAGE("no X display, skipped");
      return;
   }

   wisp::AsyncEventReceiver rx;
   auto                     w = wisp::AsyncWindow::builder(rx).title("app events").visible(false).build_async().get();

   std::vector<wisp::App> sent{{0, 1, 2}, {1, -5, 7}, {2, 0, 0}, {3, -1, 1L << 30}};
   for (auto& ev : sent)
      w.post_app_event(ev);

   std::vector<wisp::App> got;
   while (got.size() < sent.size()) {
      auto ev = rx.recv().get();
      REQUIRE(ev.has_value());
      if (auto* app = std::get_if<wisp::App>(&ev->first)) {
         CHECK(wisp::handle_of(ev->second) == w.handle());
         got.push_back(*app);
      }
   }
   CHECK(got == sent);

   w.close();
   bool closed = false;
   while (auto ev = rx.recv().get())
      closed |= std::holds_alternative<wisp::Closed>(ev->first);
   CHECK(closed);
   CHECK(wisp::UiThread::join() == 0);
}
