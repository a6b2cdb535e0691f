#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <receiver.hpp>
#include <ui_thread.hpp>
#include <window.hpp>

#include <X11/Xlib.h>

#include <stdexcept>
#include <string>

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

TEST_CASE("an exception on the UI thread is rethrown by the designated receiver") {
   if (!have_display()) {
      MESSAGE("no X display, skipped");
      return;
   }

   wisp::EventReceiver windows;
   wisp::EventReceiver faults;
   wisp::UiThread::set_receiver_for_fault(faults.id());

   auto w = wisp::Window::builder(windows).title("fault").visible(false).build();
   wisp::UiThread::send_task([] { throw std::runtime_error("boom"); });

   // the windows are closed, then the channel is disconnected without the fault
   bool closed = false;
   while (auto ev = windows.recv())
      closed |= std::holds_alternative<wisp::Closed>(ev->first);
   CHECK(closed);

   std::string what;
   try {
      while (faults.recv()) {
      }
   } catch (const std::runtime_error& e) {
      what = e.what();
   }
   CHECK(what == "boom");
   CHECK(!faults.recv());

   CHECK(w.is_closed());
   CHECK(wisp::UiThread::join() == 1);
   CHECK(wisp::UiThread::is_finished());
}
