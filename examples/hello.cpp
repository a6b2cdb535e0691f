#include <wisp.hpp>

#include <cstdio>

// Opens one window and prints what happens to it. Escape closes it.
int main() {
   wisp::EventReceiver rx;
   auto                window = wisp::Window::builder(rx).title("wisp - hello").inner_size({640, 480}).build();

   while (auto ev = rx.recv()) {
      auto& [event, kind] = *ev;
      std::visit(wisp::overloaded{
                    [](const wisp::Draw& d) {
                       auto& r = d.invalidate_rect;
                       wisp::print(stdout, "draw ({}, {}) - ({}, {})\n", r.left, r.top, r.right, r.bottom);
                    },
                    [](const wisp::Resized& e) { wisp::print(stdout, "resized {}x{}\n", e.size.width, e.size.height); },
                    [](const wisp::Moved& e) { wisp::print(stdout, "moved to {}, {}\n", e.position.x, e.position.y); },
                    [&](const wisp::KeyInput& k) {
                       if (k.is(wisp::VirtualKey::ESCAPE, wisp::KeyState::pressed))
                          window.close();
                    },
                    [](const wisp::CharInput& c) { wisp::print(stdout, "char U+{:04X}\n", static_cast<uint32_t>(c.c)); },
                    [](const wisp::Other&) {},
                    [&](const auto&) { wisp::print(stdout, "{}\n", wisp::event_name(event)); },
                 },
                 event);
   }
   return wisp::UiThread::join();
}
