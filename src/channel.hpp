#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace wisp {

// ---------------------------------------------------------------------------------------------
//                              unbounded multi-producer / single consumer queue
// ---------------------------------------------------------------------------------------------
enum class TryRecvError { empty, disconnected };

template <class T>
class Sender;
template <class T>
class Receiver;
template <class T>
class RecvFuture;

template <class T>
class Channel {
   friend class Sender<T>;
   friend class Receiver<T>;
   friend class RecvFuture<T>;

public:
   // returns false (and drops the item) when the receiving end is gone
   bool push(T&& item) { return deliver(std::move(item), false); }

   size_t size() const {
      std::unique_lock lock(_mutex);
      return _queue.size();
   }

private:
   struct Waiter {
      uint64_t                       id;
      std::promise<std::optional<T>> promise;
   };

   // a parked `recv_async` gets the item first, otherwise it is queued at the back (or front)
   bool deliver(T&& item, bool front) {
      std::optional<std::promise<std::optional<T>>> waiter;
      {
         std::unique_lock lock(_mutex);
         if (!_receiver_alive)
            return false;
         if (_waiters.empty()) {
            if (front)
               _queue.push_front(std::move(item));
            else
               _queue.push_back(std::move(item));
            _cv.notify_one();
            return true;
         }
         waiter.emplace(std::move(_waiters.front().promise));
         _waiters.pop_front();
      }
      waiter->set_value(std::optional<T>{std::move(item)});
      return true;
   }

   void add_sender() {
      std::unique_lock lock(_mutex);
      ++_senders;
   }

   void remove_sender() {
      std::deque<Waiter> waiters;
      {
         std::unique_lock lock(_mutex);
         if (--_senders != 0)
            return;
         waiters.swap(_waiters);
         _cv.notify_all();
      }
      for (auto& w : waiters)
         w.promise.set_value(std::nullopt);
   }

   std::optional<T> pop() {
      std::unique_lock lock(_mutex);
      _cv.wait(lock, [this] { return !_queue.empty() || _senders == 0; });
      if (_queue.empty())
         return {};
      auto value = std::move(_queue.front());
      _queue.pop_front();
      return std::optional<T>{std::move(value)};
   }

   std::expected<T, TryRecvError> try_pop() {
      std::unique_lock lock(_mutex);
      if (_queue.empty())
         return std::unexpected(_senders == 0 ? TryRecvError::disconnected : TryRecvError::empty);
      auto value = std::move(_queue.front());
      _queue.pop_front();
      return value;
   }

   // id 0 when resolved on the spot
   std::pair<uint64_t, std::future<std::optional<T>>> pop_async() {
      std::promise<std::optional<T>> p;
      auto                           fut = p.get_future();
      std::unique_lock               lock(_mutex);
      if (!_queue.empty()) {
         p.set_value(std::optional<T>{std::move(_queue.front())});
         _queue.pop_front();
         return {0, std::move(fut)};
      }
      if (_senders == 0) {
         p.set_value(std::nullopt);
         return {0, std::move(fut)};
      }
      auto id = ++_last_waiter;
      _waiters.push_back(Waiter{id, std::move(p)});
      return {id, std::move(fut)};
   }

   // a `recv_async` abandoned before `get`: the item it was handed, if any, goes back in front
   void cancel_waiter(uint64_t id, std::future<std::optional<T>>& fut) {
      {
         std::unique_lock lock(_mutex);
         auto             it = std::ranges::find(_waiters, id, &Waiter::id);
         if (id != 0 && it != _waiters.end()) {
            _waiters.erase(it);
            return;
         }
      }
      // resolved, or about to be by a `deliver` which released the lock
      if (auto item = fut.get())
         deliver(std::move(*item), true);
   }

   // items still queued are destroyed, which drops any reply sender they carry
   void close_receiver() {
      std::deque<T>      items;
      std::deque<Waiter> waiters;
      {
         std::unique_lock lock(_mutex);
         _receiver_alive = false;
         items.swap(_queue);
         waiters.swap(_waiters);
      }
      for (auto& w : waiters)
         w.promise.set_value(std::nullopt);
   }

   std::deque<T>           _queue;
   std::deque<Waiter>      _waiters;
   mutable std::mutex      _mutex;
   std::condition_variable _cv;
   size_t                  _senders        = 0;
   uint64_t                _last_waiter    = 0;
   bool                    _receiver_alive = true;
};

// ---------------------------------------------------------------------------------------------
// The pending result of `Receiver::recv_async`. Destroying it before `get` puts the item it
// was handed back at the front of the queue, so an abandoned receive loses nothing.
// ---------------------------------------------------------------------------------------------
template <class T>
class RecvFuture {
public:
   RecvFuture(std::shared_ptr<Channel<T>> chan, uint64_t id, std::future<std::optional<T>>&& fut)
      : _chan(std::move(chan))
      , _id(id)
      , _future(std::move(fut)) {}

   RecvFuture(RecvFuture&&) noexcept = default;

   RecvFuture& operator=(RecvFuture&& o) noexcept {
      if (this != &o) {
         cancel();
         _chan   = std::move(o._chan);
         _id     = o._id;
         _future = std::move(o._future);
      }
      return *this;
   }

   ~RecvFuture() { cancel(); }

   std::optional<T> get() {
      _chan.reset();
      return _future.get();
   }

   bool valid() const noexcept { return _future.valid(); }
   void wait() const { _future.wait(); }

   template <class Rep, class Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& d) const {
      return _future.wait_for(d);
   }

private:
   void cancel() {
      if (_chan && _future.valid())
         _chan->cancel_waiter(_id, _future);
      _chan.reset();
   }

   std::shared_ptr<Channel<T>>   _chan;
   uint64_t                      _id = 0;
   std::future<std::optional<T>> _future;
};

// ---------------------------------------------------------------------------------------------
template <class T>
class Sender {
public:
   Sender() = default;

   explicit Sender(std::shared_ptr<Channel<T>> chan)
      : _chan(std::move(chan)) {
      if (_chan)
         _chan->add_sender();
   }

   Sender(const Sender& o)
      : Sender(o._chan) {}

   Sender(Sender&& o) noexcept
      : _chan(std::move(o._chan)) {}

   Sender& operator=(Sender o) noexcept {
      std::swap(_chan, o._chan);
      return *this;
   }

   ~Sender() { reset(); }

   bool send(T item) const { return _chan && _chan->push(std::move(item)); }

   void reset() {
      if (_chan) {
         _chan->remove_sender();
         _chan.reset();
      }
   }

   explicit operator bool() const { return !!_chan; }

private:
   std::shared_ptr<Channel<T>> _chan;
};

// ---------------------------------------------------------------------------------------------
template <class T>
class Receiver {
public:
   explicit Receiver(std::shared_ptr<Channel<T>> chan)
      : _chan(std::move(chan)) {}

   Receiver(Receiver&&) noexcept            = default;
   Receiver& operator=(Receiver&&) noexcept = default;
   Receiver(const Receiver&)                = delete;
   Receiver& operator=(const Receiver&)     = delete;

   ~Receiver() {
      if (_chan)
         _chan->close_receiver();
   }

   // blocks until an item is available, returns std::nullopt when every sender is gone
   std::optional<T>               recv() { return _chan->pop(); }
   std::expected<T, TryRecvError> try_recv() { return _chan->try_pop(); }
   RecvFuture<T>                  recv_async() {
      auto [id, fut] = _chan->pop_async();
      return RecvFuture<T>(_chan, id, std::move(fut));
   }

private:
   std::shared_ptr<Channel<T>> _chan;
};

template <class T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
   auto chan = std::make_shared<Channel<T>>();
   return {Sender<T>(chan), Receiver<T>(chan)};
}

// ---------------------------------------------------------------------------------------------
//                              single reply channel
// ---------------------------------------------------------------------------------------------
// A sender destroyed without `send` resolves the receiver to std::nullopt.
template <class T>
class OneShotSender {
public:
   OneShotSender() = default;
   explicit OneShotSender(std::promise<std::optional<T>>&& p)
      : _promise(std::move(p))
      , _armed(true) {}

   OneShotSender(OneShotSender&& o) noexcept
      : _promise(std::move(o._promise))
      , _armed(std::exchange(o._armed, false)) {}

   OneShotSender& operator=(OneShotSender&& o) noexcept {
      if (this != &o) {
         drop();
         _promise = std::move(o._promise);
         _armed   = std::exchange(o._armed, false);
      }
      return *this;
   }

   ~OneShotSender() { drop(); }

   void send(T value) {
      if (_armed) {
         _armed = false;
         _promise.set_value(std::optional<T>{std::move(value)});
      }
   }

   void drop() {
      if (_armed) {
         _armed = false;
         _promise.set_value(std::nullopt);
      }
   }

   bool pending() const noexcept { return _armed; }

private:
   std::promise<std::optional<T>> _promise;
   bool                           _armed = false;
};

template <class T>
class OneShotReceiver {
public:
   explicit OneShotReceiver(std::future<std::optional<T>>&& f)
      : _future(std::move(f)) {}

   std::optional<T>              wait() { return _future.get(); }
   std::future<std::optional<T>> into_future() { return std::move(_future); }

private:
   std::future<std::optional<T>> _future;
};

template <class T>
std::pair<OneShotSender<T>, OneShotReceiver<T>> make_oneshot() {
   std::promise<std::optional<T>> p;
   OneShotReceiver<T>             rx(p.get_future());
   return {OneShotSender<T>(std::move(p)), std::move(rx)};
}

} // namespace wisp
