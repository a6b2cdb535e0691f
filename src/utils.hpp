#pragma once

#include <atomic>
#include <charconv>
#include <cstdio>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#if defined(__linux__) || defined(__FreeBSD__)
   #include <pthread.h>
#endif

namespace wisp {

// ---------------------------------------------------------------------------
//                              printing / logging
// ---------------------------------------------------------------------------
template <typename... Args>
void print(std::ostream& stream, std::format_string<Args...> fmt, Args&&... args) {
   stream << std::format(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void print(FILE* f, std::format_string<Args...> fmt, Args&&... args) {
   std::string formatted = std::format(fmt, std::forward<Args>(args)...);
   fprintf(f, "%s", formatted.c_str());
}

enum class log_level { debug, info, warning, error, off };

inline std::atomic<log_level>& current_log_level() {
   static std::atomic<log_level> level{log_level::warning};
   return level;
}

inline void set_log_level(log_level l) { current_log_level().store(l); }

inline bool log_enabled(log_level l) { return l >= current_log_level().load(std::memory_order_relaxed); }

// accepts "debug", "info", "warning", "error" or "off"; returns `def` otherwise
inline log_level parse_log_level(std::string_view sv, log_level def) {
   if (sv == "debug")
      return log_level::debug;
   if (sv == "info")
      return log_level::info;
   if (sv == "warning" || sv == "warn")
      return log_level::warning;
   if (sv == "error")
      return log_level::error;
   if (sv == "off")
      return log_level::off;
   return def;
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args&&... args) {
   if (log_enabled(log_level::error))
      print(std::cerr, "Error: {}\n", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warning(std::format_string<Args...> fmt, Args&&... args) {
   if (log_enabled(log_level::warning))
      print(std::cerr, "Warning: {}\n", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args&&... args) {
   if (log_enabled(log_level::info))
      print(std::cerr, "Info: {}\n", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(std::format_string<Args...> fmt, Args&&... args) {
   if (log_enabled(log_level::debug))
      print(std::cerr, "Debug: {}\n", std::format(fmt, std::forward<Args>(args)...));
}

// ---------------------------------------------------------------------------
template <class T>
inline T wisp_atoi(std::string_view sv) {
   T result{};
   auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
   if (ec == std::errc())
      return result;
   return 0;
}

// ---------------------------------------------------------------------------
// assigns val to var, and returns true if the value changed
// ---------------------------------------------------------------------------
template <class T, class V>
bool wisp_set(T& var, V&& val) noexcept(std::is_nothrow_move_assignable_v<T> && std::is_nothrow_copy_assignable_v<T>) {
   if (var != val) {
      var = std::forward<V>(val);
      return true;
   }
   return false;
}

// ---------------------------------------------------------------------------
// An object which calls a lambda in its  destructor
//
// This object must be captured in a local variable, Otherwise, since it is a
// temporary, it will be destroyed immediately, thus calling the function.
//
//          scoped_guard rollback(...); // good
// ---------------------------------------------------------------------------
template <class F>
class scoped_guard {
public:
   [[nodiscard]] scoped_guard(F&& unset, bool do_it = true) noexcept(std::is_nothrow_move_constructible_v<F>)
      : do_it_(do_it)
      , unset_(std::move(unset)) {}

   ~scoped_guard() {
      if (do_it_)
         unset_();
   }

   void dismiss() noexcept { do_it_ = false; }

   scoped_guard(scoped_guard&&)                 = delete;
   scoped_guard(const scoped_guard&)            = delete;
   scoped_guard& operator=(const scoped_guard&) = delete;
   void*         operator new(std::size_t)      = delete;

private:
   bool do_it_;
   F    unset_;
};

// ---------------------------------------------------------------------------
inline void set_thread_name(const char* name) {
#if defined(__linux__) || defined(__FreeBSD__)
   // linux limits thread names to 15 chars + terminator
   char buff[16] = {};
   std::format_to_n(buff, sizeof(buff) - 1, "{}", name);
   pthread_setname_np(pthread_self(), buff);
#else
   (void)name;
#endif
}

} // namespace wisp
