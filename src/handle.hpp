#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>

namespace wisp {

// identifies an event receiver, from a process-wide monotonic counter
using ReceiverId = uint64_t;

// ---------------------------------------------------------------------------
// Identifies a native window (an X11 XID). Does not own the window.
// ---------------------------------------------------------------------------
class WindowHandle {
public:
   using native_type = unsigned long; // same as X11's `Window`

   constexpr WindowHandle() = default;
   constexpr explicit WindowHandle(native_type xid)
      : _xid(xid) {}

   constexpr native_type native() const noexcept { return _xid; }
   constexpr bool        valid() const noexcept { return _xid != 0; }

   constexpr bool operator==(const WindowHandle&) const = default;
   constexpr auto operator<=>(const WindowHandle&) const = default;

private:
   native_type _xid = 0;
};

} // namespace wisp

template <>
struct std::hash<wisp::WindowHandle> {
   size_t operator()(const wisp::WindowHandle& h) const noexcept { return std::hash<unsigned long>{}(h.native()); }
};

template <>
struct std::formatter<wisp::WindowHandle> : std::formatter<unsigned long> {
   auto format(const wisp::WindowHandle& h, std::format_context& ctx) const {
      return std::formatter<unsigned long>::format(h.native(), ctx);
   }
};
