#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <context.hpp>
#include <error.hpp>
#include <ime.hpp>

#include <stdexcept>
#include <string>

namespace {

wisp::Window window(unsigned long xid) { return wisp::Window(wisp::WindowHandle(xid)); }

wisp::EventItem next_item(wisp::Receiver<wisp::RecvElement>& rx) {
   auto elem = rx.try_recv();
   REQUIRE(elem.has_value());
   REQUIRE(std::holds_alternative<wisp::EventItem>(*elem));
   return std::get<wisp::EventItem>(std::move(*elem));
}

std::string fault_message(wisp::Receiver<wisp::RecvElement>& rx) {
   auto elem = rx.try_recv();
   REQUIRE(elem.has_value());
   REQUIRE(std::holds_alternative<std::exception_ptr>(*elem));
   try {
      std::rethrow_exception(std::get<std::exception_ptr>(*elem));
   } catch (const std::exception& e) {
      return e.what();
   }
   return {};
}

// records whether the windows were gone when the input method was closed
struct FakeTextService : wisp::ime::TextService {
   explicit FakeTextService(wisp::Context& ctx)
      : _ctx(ctx) {}

   void init(::Display*) override { _active = true; }
   void shutdown() override {
      ++shutdowns;
      windows_left = _ctx.window_count();
      _active      = false;
   }
   bool is_active() const override { return _active; }

   int    shutdowns    = 0;
   size_t windows_left = 0;

private:
   wisp::Context& _ctx;
   bool           _active = false;
};

} // namespace

TEST_CASE("window registration") {
   wisp::Context ctx;
   auto [tx, rx] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx);
   CHECK(ctx.has_event_channel(1));
   CHECK(!ctx.has_event_channel(2));

   CHECK_THROWS_AS(ctx.register_window(window(0x10), {}, 2), wisp::Error);
   CHECK(ctx.is_empty());

   auto h = ctx.register_window(window(0x10), {}, 1);
   CHECK(h == wisp::WindowHandle(0x10));
   CHECK(ctx.contains(h));
   CHECK(ctx.window_count() == 1);

   auto rec = ctx.remove_window(h);
   REQUIRE(rec.has_value());
   CHECK(wisp::handle_of(rec->kind) == h);
   CHECK(!ctx.contains(h));
   CHECK(!ctx.remove_window(h));
}

TEST_CASE("parent and children") {
   wisp::Context ctx;
   auto [tx, rx] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx);

   auto parent = ctx.register_window(window(0x10), {}, 1);

   wisp::WindowProps child_props;
   child_props.parent = parent;
   auto c1            = ctx.register_window(window(0x11), child_props, 1);
   auto c2            = ctx.register_window(window(0x12), child_props, 1);
   CHECK(ctx.children(parent) == std::vector{c1, c2});

   ctx.remove_window(c1);
   CHECK(ctx.children(parent) == std::vector{c2});

   auto rec = ctx.remove_window(parent);
   REQUIRE(rec.has_value());
   CHECK(rec->children == std::vector{c2});
   CHECK(!ctx.children(parent));
}

TEST_CASE("window properties") {
   wisp::Context ctx;
   auto [tx, rx] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx);
   auto h = ctx.register_window(window(0x10), {}, 1);

   CHECK(ctx.set_window_props(h, [](wisp::WindowProps& p) {
      p.minimized = true;
      p.cursor    = wisp::Cursor::hand;
   }));
   auto state = ctx.get_window_props(h, [](const wisp::WindowProps& p) { return std::pair{p.minimized, p.cursor}; });
   CHECK(state == std::pair{true, wisp::Cursor::hand});

   // absent, never a default
   wisp::WindowHandle gone(0x99);
   CHECK(!ctx.get_window_props(gone, [](const wisp::WindowProps& p) { return p.minimized; }));
   CHECK(!ctx.set_window_props(gone, [](wisp::WindowProps& p) { p.minimized = true; }));
}

TEST_CASE("events go to the receiver the window was registered with") {
   wisp::Context ctx;
   auto [tx1, rx1] = wisp::make_channel<wisp::RecvElement>();
   auto [tx2, rx2] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx1);
   ctx.register_event_channel(2, tx2);

   auto a = ctx.register_window(window(0x10), {}, 1);
   auto b = ctx.register_window(window(0x20), {}, 2);

   ctx.send_event(a, wisp::Activated{});
   ctx.send_event(b, wisp::App{3, 4, 5});
   ctx.send_event(a, wisp::Inactivated{});
   ctx.send_event(wisp::WindowHandle(0x99), wisp::Closed{}); // dropped

   auto e1 = next_item(rx1);
   CHECK(std::holds_alternative<wisp::Activated>(e1.event));
   CHECK(wisp::handle_of(e1.window) == a);
   CHECK(std::holds_alternative<wisp::Inactivated>(next_item(rx1).event));
   CHECK(rx1.try_recv().error() == wisp::TryRecvError::empty);

   auto e2 = next_item(rx2);
   CHECK(std::get<wisp::App>(e2.event) == wisp::App{3, 4, 5});
   CHECK(rx2.try_recv().error() == wisp::TryRecvError::empty);
}

TEST_CASE("events to a dropped receiver release their reply") {
   wisp::Context ctx;
   auto [tx, rx] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx);
   auto h = ctx.register_window(window(0x10), {}, 1);
   {
      auto gone = std::move(rx);
   }

   auto [reply_tx, reply_rx] = wisp::make_oneshot<wisp::NcHitTestValue>();
   ctx.send_event(h, wisp::NcHitTest({1, 2}, std::move(reply_tx)));
   CHECK(!reply_rx.wait());
}

TEST_CASE("fault delivery") {
   wisp::Context ctx;
   FakeTextService ts(ctx);
   ts.init(nullptr);
   ctx.set_text_service(&ts);

   auto [tx1, rx1] = wisp::make_channel<wisp::RecvElement>();
   auto [tx2, rx2] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx1);
   ctx.register_event_channel(2, tx2);
   tx1.reset();
   tx2.reset();
   ctx.register_window(window(0x10), {}, 1);
   ctx.register_window(window(0x20), {}, 2);

   SUBCASE("first receiver by default") {
      ctx.send_fault(std::make_exception_ptr(std::runtime_error("boom")));

      CHECK(std::holds_alternative<wisp::Closed>(next_item(rx1).event));
      CHECK(fault_message(rx1) == "boom");
      CHECK(std::holds_alternative<wisp::Closed>(next_item(rx2).event));
      CHECK(rx2.try_recv().error() == wisp::TryRecvError::disconnected);
   }
   SUBCASE("designated receiver") {
      ctx.set_fault_receiver(2);
      ctx.send_fault(std::make_exception_ptr(std::logic_error("bad state")));

      CHECK(std::holds_alternative<wisp::Closed>(next_item(rx2).event));
      CHECK(fault_message(rx2) == "bad state");
      CHECK(std::holds_alternative<wisp::Closed>(next_item(rx1).event));
      CHECK(rx1.try_recv().error() == wisp::TryRecvError::disconnected);
   }
   SUBCASE("designated receiver gone, lowest id remaining") {
      ctx.set_fault_receiver(7);
      ctx.send_fault(std::make_exception_ptr(std::runtime_error("fallback")));

      next_item(rx1);
      CHECK(fault_message(rx1) == "fallback");
   }

   CHECK(ctx.is_empty());
   CHECK(!ctx.has_event_channel(1));
   CHECK(ts.shutdowns == 1);
   CHECK(ts.windows_left == 0);
   CHECK(!ts.is_active());
}

TEST_CASE("shutdown disconnects every receiver") {
   wisp::Context ctx;
   FakeTextService ts(ctx);
   ctx.set_text_service(&ts);

   auto [tx, rx] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx);
   tx.reset();
   ctx.register_window(window(0x10), {}, 1);

   ctx.shutdown();
   CHECK(ctx.is_empty());
   CHECK(!rx.recv());
   CHECK(ts.shutdowns == 1);

   ctx.shutdown(); // text service already detached
   CHECK(ts.shutdowns == 1);
}

TEST_CASE("unregistered receivers are not used for faults") {
   wisp::Context ctx;
   auto [tx1, rx1] = wisp::make_channel<wisp::RecvElement>();
   auto [tx2, rx2] = wisp::make_channel<wisp::RecvElement>();
   ctx.register_event_channel(1, tx1);
   ctx.register_event_channel(2, tx2);
   ctx.unregister_event_channel(1);
   CHECK(!ctx.has_event_channel(1));

   ctx.send_fault(std::make_exception_ptr(std::runtime_error("to 2")));
   CHECK(fault_message(rx2) == "to 2");
   CHECK(rx1.try_recv().error() == wisp::TryRecvError::empty);
}
