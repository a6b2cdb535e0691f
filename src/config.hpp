#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

#include "style.hpp"
#include "utils.hpp"

namespace wisp {

// ---------------------------------------------------------------------------------------------
// Iterates over the `[section]`, `key = value` entries of an .ini buffer
// ---------------------------------------------------------------------------------------------
struct INI_Parser {
   struct parse_result_t {
      std::string_view _section;
      std::string_view _key;
      std::string_view _value;

      template <class T, class F>
      bool parse(std::string_view sv, T& dest, F&& f) const {
         if (_key == sv && !_value.empty()) {
            dest = std::forward<F>(f)(_value);
            return true;
         }
         return false;
      }

      bool parse_str(std::string_view sv, std::string& dest) const {
         return parse(sv, dest, [](std::string_view s) { return std::string(s); });
      }

      bool parse_int(std::string_view sv, int& dest) const {
         return parse(sv, dest, [](std::string_view s) { return wisp_atoi<int>(s); });
      }

      bool operator==(const parse_result_t&) const = default;
   };

   struct iterator {
      using iterator_category = std::input_iterator_tag;
      using value_type        = const parse_result_t;
      using pointer           = value_type*;
      using reference         = value_type&;
      using difference_type   = std::ptrdiff_t;

      iterator()
         : _curr_pos(nullptr)
         , _remaining(0) {}

      iterator(const char* start, size_t bytes)
         : _curr_pos(start)
         , _remaining(bytes) {}

      friend bool operator==(const iterator& a, const iterator& b) { return a._curr_pos == b._curr_pos; }

      reference operator*() const { return _parse_result; }
      pointer   operator->() const { return &_parse_result; }

      iterator& operator++();
      iterator  operator++(int) {
         iterator temp = *this;
         ++*this;
         return temp;
      }

   private:
      const char* _curr_pos;
      size_t      _remaining;

      parse_result_t _parse_result;

      // last section/key/value parsed
      // -----------------------------
      std::string_view _section;
   };

   static_assert(std::input_iterator<iterator>);

   INI_Parser(std::string_view buff)
      : _buff(buff) {}

   iterator begin() const {
      if (_buff.empty())
         return end();
      iterator res(_buff.data(), _buff.size());
      ++res; // populate first _parse_result so we are at the beginning
      return res;
   }

   iterator end() const { return iterator(); }

private:
   std::string_view _buff;
};

static_assert(std::ranges::input_range<INI_Parser>);

// ---------------------------------------------------------------------------------------------
// Process-wide settings, read from `$WISP_CONFIG` or `~/.config/wisp_config.ini`
//
//   [log]        level = debug | info | warning | error | off
//   [display]    name = :0        dpi = 144  (0 queries the X server)
//   [window]     color_mode = system | light | dark
//   [ui_thread]  name = wisp_ui
// ---------------------------------------------------------------------------------------------
struct Config {
   log_level   level       = log_level::warning;
   std::string display_name;             // empty uses $DISPLAY
   uint32_t    dpi         = 0;          // 0 means query the X server
   ColorMode   color_mode  = ColorMode::system;
   std::string thread_name = "wisp_ui";

   // entries which do not apply are ignored, bad values keep the defaults
   void parse(std::string_view ini);

   // $WISP_LOG_LEVEL overrides the file
   void apply_environment();

   static std::optional<std::filesystem::path> default_path();

   // missing file is not an error
   static Config load();
   static Config load(const std::filesystem::path& path);
};

} // namespace wisp
