#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace wisp {

// ---------------------------------------------------------------------------
enum class ErrorKind {
   api,              // the X server rejected a request (window creation...)
   io,               // a file or the display connection could not be used
   ui_thread_closed  // the UI thread has already shut down
};

inline std::string_view to_string(ErrorKind k) {
   switch (k) {
   case ErrorKind::api:
      return "api";
   case ErrorKind::io:
      return "io";
   case ErrorKind::ui_thread_closed:
      return "ui_thread_closed";
   }
   return "unknown";
}

// ---------------------------------------------------------------------------
class Error : public std::runtime_error {
public:
   Error(ErrorKind kind, const std::string& msg)
      : std::runtime_error(msg)
      , _kind(kind) {}

   static Error ui_thread_closed() { return Error(ErrorKind::ui_thread_closed, "the UI thread has been closed"); }

   ErrorKind kind() const noexcept { return _kind; }

private:
   ErrorKind _kind;
};

} // namespace wisp
