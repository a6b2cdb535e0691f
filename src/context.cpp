#include "context.hpp"
#include "error.hpp"
#include "ime.hpp"
#include "utils.hpp"

#include <algorithm>

namespace wisp {

Context& Context::get() {
   static Context ctx;
   return ctx;
}

// ---------------------------------------------------------------------------------------------
//                              receivers
// ---------------------------------------------------------------------------------------------
void Context::register_event_channel(ReceiverId id, EventSender tx) {
   std::lock_guard lock(_channels_mutex);
   _channels.insert_or_assign(id, std::move(tx));
   if (!_fault_receiver)
      _fault_receiver = id;
}

void Context::unregister_event_channel(ReceiverId id) {
   EventSender tx;
   {
      std::lock_guard lock(_channels_mutex);
      auto            it = _channels.find(id);
      if (it == _channels.end())
         return;
      tx = std::move(it->second);
      _channels.erase(it);
      if (_fault_receiver == id)
         _fault_receiver.reset();
   }
}

bool Context::has_event_channel(ReceiverId id) const {
   std::lock_guard lock(_channels_mutex);
   return _channels.contains(id);
}

void Context::set_fault_receiver(ReceiverId id) {
   std::lock_guard lock(_channels_mutex);
   _fault_receiver = id;
}

// ---------------------------------------------------------------------------------------------
//                              windows
// ---------------------------------------------------------------------------------------------
WindowHandle Context::register_window(WindowKind kind, WindowProps props, ReceiverId receiver) {
   EventSender tx;
   {
      std::lock_guard lock(_channels_mutex);
      auto            it = _channels.find(receiver);
      if (it == _channels.end())
         throw Error(ErrorKind::api, std::format("event receiver {} is not registered", receiver));
      tx = it->second;
   }

   WindowHandle h      = handle_of(kind);
   auto         parent = props.parent;
   {
      std::lock_guard lock(_windows_mutex);
      _windows.insert_or_assign(h, WindowRecord{std::move(kind), std::move(tx), std::move(props), {}});
      if (parent) {
         if (auto it = _windows.find(*parent); it != _windows.end())
            it->second.children.push_back(h);
      }
   }
   log_debug("window {} registered for receiver {}", h, receiver);
   return h;
}

std::optional<WindowRecord> Context::remove_window(WindowHandle h) {
   std::optional<WindowRecord> res;
   {
      std::lock_guard lock(_windows_mutex);
      auto            it = _windows.find(h);
      if (it == _windows.end())
         return std::nullopt;
      res.emplace(std::move(it->second));
      _windows.erase(it);

      if (res->props.parent) {
         if (auto p = _windows.find(*res->props.parent); p != _windows.end())
            std::erase(p->second.children, h);
      }
   }
   log_debug("window {} removed", h);
   return res;
}

bool Context::contains(WindowHandle h) const {
   std::lock_guard lock(_windows_mutex);
   return _windows.contains(h);
}

bool Context::is_empty() const {
   std::lock_guard lock(_windows_mutex);
   return _windows.empty();
}

size_t Context::window_count() const {
   std::lock_guard lock(_windows_mutex);
   return _windows.size();
}

std::optional<std::vector<WindowHandle>> Context::children(WindowHandle h) const {
   std::lock_guard lock(_windows_mutex);
   auto            it = _windows.find(h);
   if (it == _windows.end())
      return std::nullopt;
   return it->second.children;
}

void Context::send_event(WindowHandle h, Event ev) {
   EventSender tx;
   WindowKind  kind;
   {
      std::lock_guard lock(_windows_mutex);
      auto            it = _windows.find(h);
      if (it == _windows.end())
         return;
      tx   = it->second.event_tx;
      kind = it->second.kind;
   }
   if (log_enabled(log_level::debug))
      log_debug("{} -> window {}", event_name(ev), h);
   // a closed receiver destroys the event here, which drops any reply it carries
   tx.send(EventItem{std::move(ev), std::move(kind)});
}

void Context::close_all_windows() {
   std::vector<std::pair<EventSender, WindowKind>> targets;
   {
      std::lock_guard lock(_windows_mutex);
      targets.reserve(_windows.size());
      for (const auto& [h, rec] : _windows)
         targets.emplace_back(rec.event_tx, rec.kind);
   }
   for (auto& [tx, kind] : targets)
      tx.send(EventItem{Closed{}, std::move(kind)});
}

// ---------------------------------------------------------------------------------------------
//                              lifecycle
// ---------------------------------------------------------------------------------------------
void Context::shutdown_text_service() {
   if (auto* ts = _text_service.exchange(nullptr))
      ts->shutdown();
}

void Context::send_fault(std::exception_ptr fault) {
   close_all_windows();

   // input contexts go before the input method they belong to
   std::unordered_map<WindowHandle, WindowRecord> windows;
   {
      std::lock_guard lock(_windows_mutex);
      windows.swap(_windows);
   }
   windows.clear();
   shutdown_text_service();

   std::unordered_map<ReceiverId, EventSender> channels;
   std::optional<ReceiverId>                   target;
   {
      std::lock_guard lock(_channels_mutex);
      channels.swap(_channels);
      target = _fault_receiver;
      if (!target || !channels.contains(*target)) {
         auto lowest = std::min_element(channels.begin(), channels.end(),
                                        [](const auto& a, const auto& b) { return a.first < b.first; });
         target      = lowest == channels.end() ? std::nullopt : std::optional<ReceiverId>(lowest->first);
      }
      _fault_receiver = target;
   }

   if (target && channels.at(*target).send(fault)) {
      log_debug("fault handed to receiver {}", *target);
   } else {
      try {
         std::rethrow_exception(fault);
      } catch (const std::exception& e) {
         log_error("UI thread fault with no receiver to report to: {}", e.what());
      } catch (...) {
         log_error("UI thread fault with no receiver to report to");
      }
   }
   channels.clear();
}

void Context::shutdown() {
   std::unordered_map<WindowHandle, WindowRecord> windows;
   {
      std::lock_guard lock(_windows_mutex);
      windows.swap(_windows);
   }
   windows.clear();
   shutdown_text_service();

   std::unordered_map<ReceiverId, EventSender> channels;
   {
      std::lock_guard lock(_channels_mutex);
      channels.swap(_channels);
   }
   channels.clear();
}

} // namespace wisp
