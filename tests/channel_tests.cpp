#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <channel.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("items are received in send order") {
   auto [tx, rx] = wisp::make_channel<int>();
   for (int i = 0; i < 5; ++i)
      CHECK(tx.send(i));
   for (int i = 0; i < 5; ++i)
      CHECK(rx.recv() == i);
   CHECK(rx.try_recv().error() == wisp::TryRecvError::empty);
}

TEST_CASE("recv reports disconnection once every sender is gone") {
   auto [tx, rx] = wisp::make_channel<std::string>();
   auto tx2      = tx;
   tx.send("a");
   tx.reset();
   CHECK(rx.try_recv().value() == "a");
   CHECK(rx.try_recv().error() == wisp::TryRecvError::empty);

   tx2.send("b");
   tx2.reset();
   CHECK(rx.recv() == "b");
   CHECK(!rx.recv());
   CHECK(rx.try_recv().error() == wisp::TryRecvError::disconnected);
}

TEST_CASE("blocking recv wakes up from another thread") {
   auto [tx, rx] = wisp::make_channel<int>();
   std::thread producer([tx = std::move(tx)] {
      std::this_thread::sleep_for(10ms);
      for (int i = 0; i < 100; ++i)
         tx.send(i);
   });
   int sum = 0;
   while (auto v = rx.recv())
      sum += *v;
   producer.join();
   CHECK(sum == 4950);
}

TEST_CASE("recv_async") {
   auto [tx, rx] = wisp::make_channel<int>();

   SUBCASE("already queued") {
      tx.send(1);
      CHECK(rx.recv_async().get() == 1);
   }
   SUBCASE("sent later") {
      auto fut = rx.recv_async();
      CHECK(fut.wait_for(0ms) == std::future_status::timeout);
      tx.send(2);
      CHECK(fut.get() == 2);
   }
   SUBCASE("disconnected while waiting") {
      auto fut = rx.recv_async();
      tx.reset();
      CHECK(!fut.get());
   }
}

TEST_CASE("an abandoned recv_async loses nothing") {
   auto [tx, rx] = wisp::make_channel<int>();

   SUBCASE("dropped while waiting") {
      {
         auto abandoned = rx.recv_async();
         CHECK(abandoned.wait_for(0ms) == std::future_status::timeout);
      }
      tx.send(42);
      CHECK(rx.try_recv().value() == 42);
   }
   SUBCASE("dropped after the item was handed over") {
      {
         auto abandoned = rx.recv_async();
         tx.send(1);
         CHECK(abandoned.wait_for(0ms) == std::future_status::ready);
         tx.send(2);
      }
      CHECK(rx.try_recv().value() == 1);
      CHECK(rx.try_recv().value() == 2);
   }
   SUBCASE("dropped after resolving on the spot") {
      tx.send(3);
      {
         auto abandoned = rx.recv_async();
      }
      CHECK(rx.recv() == 3);
   }
   SUBCASE("handed to the next waiter") {
      auto first  = rx.recv_async();
      auto second = rx.recv_async();
      tx.send(4);
      {
         auto gone = std::move(first);
      }
      CHECK(second.get() == 4);
   }
}

TEST_CASE("a dropped receiver rejects and destroys items") {
   auto [tx, rx] = wisp::make_channel<std::shared_ptr<int>>();
   auto item     = std::make_shared<int>(5);
   tx.send(item);
   CHECK(item.use_count() == 2);
   {
      auto gone = std::move(rx);
   }
   CHECK(item.use_count() == 1);
   CHECK(!tx.send(item));
   CHECK(item.use_count() == 1);
}

TEST_CASE("one shot reply") {
   SUBCASE("value") {
      auto [tx, rx] = wisp::make_oneshot<int>();
      CHECK(tx.pending());
      tx.send(42);
      CHECK(!tx.pending());
      tx.send(43); // ignored
      CHECK(rx.wait() == 42);
   }
   SUBCASE("sender destroyed without a value") {
      auto [tx, rx] = wisp::make_oneshot<int>();
      {
         auto gone = std::move(tx);
      }
      CHECK(!rx.wait());
   }
   SUBCASE("explicit drop") {
      auto [tx, rx] = wisp::make_oneshot<std::string>();
      tx.drop();
      CHECK(!rx.into_future().get());
   }
   SUBCASE("answered from another thread") {
      auto [tx, rx] = wisp::make_oneshot<int>();
      std::thread t([tx = std::move(tx)]() mutable { tx.send(7); });
      CHECK(rx.wait() == 7);
      t.join();
   }
}
