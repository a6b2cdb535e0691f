#include <wisp.hpp>

#include <cstdio>

// An owned window and an embedded one; closing the main window closes both.
int main() {
   wisp::EventReceiver rx;
   auto main_window = wisp::Window::builder(rx).title("wisp - owner").inner_size({640, 480}).build();
   auto tool        = wisp::Window::builder(rx)
                   .title("wisp - owned")
                   .inner_size({200, 300})
                   .parent(main_window)
                   .style(wisp::WindowStyle::dialog())
                   .build();
   auto panel = wisp::InnerWindow::builder(rx, main_window).position({20, 20}).size({200, 100}).build();
   panel.set_cursor(wisp::Cursor::hand);

   while (auto ev = rx.recv()) {
      auto& [event, kind] = *ev;
      auto h              = wisp::handle_of(kind);
      auto name           = h == main_window.handle() ? "owner" : h == tool.handle() ? "owned" : "panel";

      if (std::holds_alternative<wisp::Closed>(event))
         wisp::print(stdout, "{} closed\n", name);
      else if (auto* m = std::get_if<wisp::MouseInput>(&event); m && m->button_state == wisp::ButtonState::pressed)
         wisp::print(stdout, "click in {} at {}, {}\n", name, m->mouse_state.position.x, m->mouse_state.position.y);
   }
   return wisp::UiThread::join();
}
