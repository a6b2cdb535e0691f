#pragma once

#include <expected>
#include <future>
#include <optional>
#include <utility>

#include "channel.hpp"
#include "context.hpp"
#include "event.hpp"
#include "window.hpp"

namespace wisp {

using RecvEvent      = std::pair<Event, WindowKind>;
using AsyncRecvEvent = std::pair<Event, AsyncWindowKind>;

// ---------------------------------------------------------------------------------------------
// Receives the events of the windows built with it, in the order the X server produced them.
//
// If the UI thread faults, the receiver designated with `UiThread::set_receiver_for_fault`
// (by default the first one created) rethrows the original exception from `recv`/`try_recv`.
// `recv` returns std::nullopt once the UI thread has shut down and every event was received.
// ---------------------------------------------------------------------------------------------
class EventReceiver {
public:
   EventReceiver();
   ~EventReceiver();

   EventReceiver(EventReceiver&& o) noexcept
      : _id(std::exchange(o._id, 0))
      , _rx(std::move(o._rx)) {}
   EventReceiver& operator=(EventReceiver&&) = delete;

   ReceiverId id() const noexcept { return _id; }

   std::optional<RecvEvent>               recv();
   std::expected<RecvEvent, TryRecvError> try_recv();

private:
   ReceiverId            _id; // 0 once moved from
   Receiver<RecvElement> _rx;
};

// ---------------------------------------------------------------------------------------------
// Same as `EventReceiver`, handing out `AsyncWindow` / `AsyncInnerWindow` and futures
// ---------------------------------------------------------------------------------------------
class AsyncEventReceiver {
public:
   AsyncEventReceiver();
   ~AsyncEventReceiver();

   AsyncEventReceiver(AsyncEventReceiver&& o) noexcept
      : _id(std::exchange(o._id, 0))
      , _rx(std::move(o._rx)) {}
   AsyncEventReceiver& operator=(AsyncEventReceiver&&) = delete;

   ReceiverId id() const noexcept { return _id; }

   // `get()` waits for the next event; a future dropped before `get()` leaves it queued
   std::future<std::optional<AsyncRecvEvent>> recv();
   std::expected<AsyncRecvEvent, TryRecvError> try_recv();

private:
   ReceiverId            _id; // 0 once moved from
   Receiver<RecvElement> _rx;
};

} // namespace wisp
