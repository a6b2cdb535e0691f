#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <receiver.hpp>
#include <ui_thread.hpp>
#include <window.hpp>

#include <X11/Xlib.h>

#include <mutex>
#include <stdexcept>
#include <string>
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

std::mutex               g_mutex;
std::vector<std::string> g_calls;

void record(std::string what) {
   std::lock_guard lock(g_mutex);
   g_calls.push_back(std::move(what) + (wisp::UiThread::is_ui_thread() ? "" : " (wrong thread)"));
}

} // namespace

TEST_CASE("hooks run in order and a failing thread end hook surfaces in join") {
   if (!have_display()) {
      MESSAGE("no X display, skipped");
      return;
   }

   bool started = wisp::UiThread::builder()
                     .name("test_ui")
                     .on_thread_start([] { record("thread start"); })
                     .on_main_loop_start([] { record("loop start"); })
                     .on_main_loop_end([] { record("loop end"); })
                     .on_thread_end([] {
                        record("thread end");
                        throw std::runtime_error("thread end failed");
                     })
                     .build();
   CHECK(started);
   CHECK(!wisp::UiThread::builder().build());
   CHECK(!wisp::UiThread::is_ui_thread());

   wisp::UiThread::add_finish_handler([] { record("finish"); });

   wisp::EventReceiver rx;
   auto                w = wisp::Window::builder(rx).visible(false).build();
   w.close();
   while (rx.recv()) {
   }

   CHECK_THROWS_WITH_AS(wisp::UiThread::join(), "thread end failed", std::runtime_error);
   CHECK(wisp::UiThread::join() == 0);

   std::lock_guard lock(g_mutex);
   CHECK(g_calls == std::vector<std::string>{"thread start", "loop start", "loop end", "finish", "thread end"});
}
