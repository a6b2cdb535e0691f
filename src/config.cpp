#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace wisp {

static std::string_view trim(std::string_view sv) {
   while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
      sv.remove_prefix(1);
   while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
      sv.remove_suffix(1);
   return sv;
}

// --------------------------------------------------
// INI file parser
// --------------------------------------------------
INI_Parser::iterator& INI_Parser::iterator::operator++() {
   // reads until character `c1` or `c2` found (or we reach the end of `_curr_pos`), skipping `c1`
   auto ini_read = [this](char c1, char c2) {
      const char* start = _curr_pos;
      size_t      count = 0;
      while (_remaining && *_curr_pos != c1 && *_curr_pos != c2) {
         ++count;
         ++_curr_pos;
         --_remaining;
      }
      if (_remaining && *_curr_pos == c1) {
         ++_curr_pos;
         --_remaining;
      }
      return trim({start, count});
   };

   while (_remaining) {
      char c = *_curr_pos;

      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
         _curr_pos++, _remaining--;
         continue;
      }
      if (c == ';' || c == '#') {
         ini_read('\n', 0);
         continue;
      }
      if (c == '[') {
         _curr_pos++, _remaining--;
         _section = ini_read(']', 0);
         ini_read('\n', 0); // rest of the line
         _parse_result = parse_result_t{._section = _section, ._key = {}, ._value = {}};
         return *this;
      }

      auto key      = ini_read('=', '\n');
      auto value    = ini_read('\n', 0);
      _parse_result = parse_result_t{._section = _section, ._key = key, ._value = value};
      return *this;
   }

   // null _curr_pos is end iterator
   *this = iterator();
   return *this;
}

// --------------------------------------------------
// Config
// --------------------------------------------------
void Config::parse(std::string_view ini) {
   for (const auto& entry : INI_Parser(ini)) {
      if (entry._key.empty())
         continue;
      if (entry._section == "log") {
         std::string lvl;
         if (entry.parse_str("level", lvl))
            level = parse_log_level(lvl, level);
      } else if (entry._section == "display") {
         int d = 0;
         entry.parse_str("name", display_name);
         if (entry.parse_int("dpi", d) && d >= 0)
            dpi = static_cast<uint32_t>(d);
      } else if (entry._section == "window") {
         std::string mode;
         if (entry.parse_str("color_mode", mode)) {
            if (mode == "light")
               color_mode = ColorMode::light;
            else if (mode == "dark")
               color_mode = ColorMode::dark;
            else if (mode == "system")
               color_mode = ColorMode::system;
            else
               log_warning("config: unknown color_mode \"{}\"", mode);
         }
      } else if (entry._section == "ui_thread") {
         entry.parse_str("name", thread_name);
      }
   }
}

void Config::apply_environment() {
   if (const char* lvl = std::getenv("WISP_LOG_LEVEL"))
      level = parse_log_level(lvl, level);
}

std::optional<std::filesystem::path> Config::default_path() {
   if (const char* p = std::getenv("WISP_CONFIG"); p && *p)
      return std::filesystem::path(p);
   if (const char* home = std::getenv("HOME"); home && *home)
      return std::filesystem::path(home) / ".config" / "wisp_config.ini";
   return std::nullopt;
}

Config Config::load(const std::filesystem::path& path) {
   Config        cfg;
   std::ifstream ifs(path);
   if (ifs) {
      std::stringstream buffer;
      buffer << ifs.rdbuf();
      cfg.parse(buffer.str());
   }
   cfg.apply_environment();
   return cfg;
}

Config Config::load() {
   if (auto path = default_path())
      return load(*path);
   Config cfg;
   cfg.apply_environment();
   return cfg;
}

} // namespace wisp
