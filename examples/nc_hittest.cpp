#include <wisp.hpp>

#include <cstdio>

namespace {

constexpr int caption_height = 32;
constexpr int border         = 8;

wisp::NcHitTestValue hit_test(wisp::PhysicalPosition<int> p, wisp::PhysicalSize<int> sz) {
   bool left   = p.x < border;
   bool right  = p.x >= sz.width - border;
   bool top    = p.y < border;
   bool bottom = p.y >= sz.height - border;

   if (top && left)
      return wisp::NcHitTestValue::top_left;
   if (top && right)
      return wisp::NcHitTestValue::top_right;
   if (bottom && left)
      return wisp::NcHitTestValue::bottom_left;
   if (bottom && right)
      return wisp::NcHitTestValue::bottom_right;
   if (left)
      return wisp::NcHitTestValue::left;
   if (right)
      return wisp::NcHitTestValue::right;
   if (top)
      return wisp::NcHitTestValue::top;
   if (bottom)
      return wisp::NcHitTestValue::bottom;
   if (p.y < caption_height)
      return wisp::NcHitTestValue::caption;
   return wisp::NcHitTestValue::client;
}

} // namespace

// A borderless window which moves and resizes itself through hit testing
int main() {
   wisp::EventReceiver rx;
   auto                window = wisp::Window::builder(rx)
                    .title("wisp - hit test")
                    .inner_size({480, 320})
                    .style(wisp::WindowStyle::borderless_window())
                    .hook_nc_hittest(true)
                    .build();
   auto size = window.inner_size().value_or(wisp::PhysicalSize<int>{480, 320});

   while (auto ev = rx.recv()) {
      auto& [event, kind] = *ev;
      if (auto* ht = std::get_if<wisp::NcHitTest>(&event)) {
         ht->set(hit_test(ht->position(), size));
      } else if (auto* r = std::get_if<wisp::Resized>(&event)) {
         size = r->size;
      } else if (auto* rs = std::get_if<wisp::Resizing>(&event)) {
         size = rs->size;
      } else if (auto* k = std::get_if<wisp::KeyInput>(&event)) {
         if (k->is(wisp::VirtualKey::ESCAPE, wisp::KeyState::pressed))
            window.close();
      } else if (std::holds_alternative<wisp::EnterResizing>(event)) {
         wisp::print(stdout, "resizing from {}x{}\n", size.width, size.height);
      }
   }
   return wisp::UiThread::join();
}
