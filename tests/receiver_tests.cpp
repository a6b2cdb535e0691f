#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <context.hpp>
#include <receiver.hpp>

#include <exception>
#include <stdexcept>

// No UI thread is started here: the faults are handed to the registry directly, as the UI thread
// does when a task throws.

TEST_CASE("an async receiver rethrows the fault from get") {
   wisp::AsyncEventReceiver rx;

   // a receive dropped before `get` does not swallow what comes next
   {
      auto abandoned = rx.recv();
   }
   wisp::Context::get().send_fault(std::make_exception_ptr(std::runtime_error("async boom")));

   auto fut = rx.recv();
   CHECK_THROWS_WITH_AS(fut.get(), "async boom", std::runtime_error);
   CHECK(!rx.recv().get());
}

TEST_CASE("a fault handed to a dropped receive stays queued") {
   wisp::AsyncEventReceiver rx;
   wisp::Context::get().set_fault_receiver(rx.id());

   auto pending = rx.recv();
   wisp::Context::get().send_fault(std::make_exception_ptr(std::logic_error("resumed")));
   {
      auto gone = std::move(pending);
   }
   CHECK_THROWS_WITH_AS(rx.recv().get(), "resumed", std::logic_error);
   CHECK(!rx.recv().get());
}

TEST_CASE("a blocking receiver rethrows from try_recv") {
   wisp::EventReceiver rx;
   wisp::Context::get().set_fault_receiver(rx.id());
   wisp::Context::get().send_fault(std::make_exception_ptr(std::runtime_error("sync boom")));

   CHECK_THROWS_WITH_AS(rx.try_recv(), "sync boom", std::runtime_error);
   CHECK(rx.try_recv().error() == wisp::TryRecvError::disconnected);
}
