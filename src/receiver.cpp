#include "receiver.hpp"
#include "ui_thread.hpp"
#include "utils.hpp"

#include <atomic>

namespace wisp {

namespace {

ReceiverId next_receiver_id() {
   static std::atomic<ReceiverId> id{1};
   return id.fetch_add(1);
}

// registers the sending half with the Context, the receiver keeps the other one
Receiver<RecvElement> open_channel(ReceiverId id) {
   auto [tx, rx] = make_channel<RecvElement>();
   auto& ctx     = Context::get();
   ctx.register_event_channel(id, std::move(tx));

   // too late, nothing will ever be sent: make `recv` report the disconnection
   if (UiThread::is_finished())
      ctx.unregister_event_channel(id);
   return std::move(rx);
}

// an exception carried in place of an event is rethrown on the receiving thread
EventItem unwrap(RecvElement&& elem) {
   if (auto* fault = std::get_if<std::exception_ptr>(&elem))
      std::rethrow_exception(*fault);
   return std::get<EventItem>(std::move(elem));
}

AsyncRecvEvent into_async(EventItem&& item) { return {std::move(item.event), to_async(item.window)}; }

} // namespace

// ---------------------------------------------------------------------------------------------
EventReceiver::EventReceiver()
   : _id(next_receiver_id())
   , _rx(open_channel(_id)) {
   log_debug("event receiver {} created", _id);
}

EventReceiver::~EventReceiver() {
   if (_id)
      Context::get().unregister_event_channel(_id);
}

std::optional<RecvEvent> EventReceiver::recv() {
   auto elem = _rx.recv();
   if (!elem)
      return std::nullopt;
   auto item = unwrap(std::move(*elem));
   return RecvEvent{std::move(item.event), std::move(item.window)};
}

std::expected<RecvEvent, TryRecvError> EventReceiver::try_recv() {
   auto elem = _rx.try_recv();
   if (!elem)
      return std::unexpected(elem.error());
   auto item = unwrap(std::move(*elem));
   return RecvEvent{std::move(item.event), std::move(item.window)};
}

// ---------------------------------------------------------------------------------------------
AsyncEventReceiver::AsyncEventReceiver()
   : _id(next_receiver_id())
   , _rx(open_channel(_id)) {
   log_debug("async event receiver {} created", _id);
}

AsyncEventReceiver::~AsyncEventReceiver() {
   if (_id)
      Context::get().unregister_event_channel(_id);
}

std::future<std::optional<AsyncRecvEvent>> AsyncEventReceiver::recv() {
   return std::async(std::launch::deferred, [fut = _rx.recv_async()]() mutable -> std::optional<AsyncRecvEvent> {
      auto elem = fut.get();
      if (!elem)
         return std::nullopt;
      return into_async(unwrap(std::move(*elem)));
   });
}

std::expected<AsyncRecvEvent, TryRecvError> AsyncEventReceiver::try_recv() {
   auto elem = _rx.try_recv();
   if (!elem)
      return std::unexpected(elem.error());
   return into_async(unwrap(std::move(*elem)));
}

} // namespace wisp
