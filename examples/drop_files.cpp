#include <wisp.hpp>

#include <chrono>
#include <cstdio>
#include <thread>

// Prints dropped files and the input method composition. A worker thread ticks through app events.
int main() {
   wisp::EventReceiver rx;
   auto                window = wisp::Window::builder(rx)
                    .title("wisp - drop files here")
                    .inner_size({480, 320})
                    .accept_drop_files(true)
                    .build();

   std::jthread ticker([window](std::stop_token st) {
      for (long n = 0; !st.stop_requested() && !window.is_closed(); ++n) {
         window.post_app_event(wisp::App{0, n, 0});
         std::this_thread::sleep_for(std::chrono::seconds(1));
      }
   });

   while (auto ev = rx.recv()) {
      auto& [event, kind] = *ev;
      std::visit(wisp::overloaded{
                    [](const wisp::DropFiles& d) {
                       wisp::print(stdout, "{} file(s) dropped at {}, {}\n", d.paths.size(), d.position.x, d.position.y);
                       for (const auto& p : d.paths)
                          wisp::print(stdout, "   {}\n", p.string());
                    },
                    [](wisp::ImeBeginComposition& b) { b.set_position({10, 10}); },
                    [](const wisp::ImeUpdateComposition& u) {
                       wisp::print(stdout, "composing \"{}\" ({} clauses)\n", u.chars, u.clauses.size());
                    },
                    [](const wisp::ImeEndComposition& e) {
                       wisp::print(stdout, "committed \"{}\"\n", e.result.value_or(""));
                    },
                    [&](const wisp::App& a) { window.set_title(std::format("wisp - drop files here ({}s)", a.value0)); },
                    [](const auto&) {},
                 },
                 event);
   }
   ticker.request_stop();
   return wisp::UiThread::join();
}
