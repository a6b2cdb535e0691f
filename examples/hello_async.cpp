#include <wisp.hpp>

#include <cstdio>

// The same window as `hello`, through the future based API
int main() {
   wisp::AsyncEventReceiver rx;
   auto window = wisp::AsyncWindow::builder(rx).title("wisp - hello async").inner_size({640, 480}).build_async().get();

   auto dpi = window.dpi().get();
   wisp::print(stdout, "dpi: {}\n", dpi.value_or(0));

   while (auto ev = rx.recv().get()) {
      auto& [event, kind] = *ev;
      if (std::holds_alternative<wisp::Closed>(event)) {
         wisp::print(stdout, "closed\n");
      } else if (auto* m = std::get_if<wisp::MouseInput>(&event)) {
         if (m->button == wisp::MouseButton::left && m->button_state == wisp::ButtonState::released) {
            auto pos = window.position().get();
            if (pos)
               wisp::print(stdout, "click, window at {}, {}\n", pos->x, pos->y);
         }
      } else if (auto* k = std::get_if<wisp::KeyInput>(&event)) {
         if (k->is(wisp::VirtualKey::ESCAPE, wisp::KeyState::pressed))
            window.close();
      }
   }
   return wisp::UiThread::join();
}
