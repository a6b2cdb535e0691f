#include <wisp.hpp>

#include <cstdio>

// The close button is handled by the application: the first click is refused.
int main() {
   wisp::EventReceiver rx;
   auto window = wisp::Window::builder(rx).title("wisp - close twice").inner_size({400, 200}).auto_close(false).build();

   int requests = 0;
   while (auto ev = rx.recv()) {
      auto& [event, kind] = *ev;
      if (auto* req = std::get_if<wisp::CloseRequest>(&event)) {
         if (++requests == 1) {
            wisp::print(stdout, "close again to confirm\n");
            window.set_title("wisp - click close again");
         } else {
            req->destroy();
         }
      } else if (std::holds_alternative<wisp::Closed>(event)) {
         wisp::print(stdout, "closed after {} requests\n", requests);
      }
   }
   return wisp::UiThread::join();
}
