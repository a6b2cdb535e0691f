#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <config.hpp>
#include <error.hpp>
#include <style.hpp>
#include <utils.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ranges>

namespace rng   = std::ranges;
namespace views = rng::views;

TEST_CASE(".ini file reading") {
   const char* ini_str = R"(
   ; comment
   [log]
      level = debug

   [display]
      name=:1
      dpi = 144
   # another comment
   [window]
      color_mode=dark
   )";

   wisp::INI_Parser ini_file(ini_str);

   auto display = ini_file | views::filter([](auto& t) { return t._section == "display" && !t._key.empty(); });
   CHECK(rng::count_if(display, [](auto&) { return true; }) == 2);

   auto first = rng::find_if(ini_file, [](auto& t) { return !t._key.empty(); });
   REQUIRE(first != rng::end(ini_file));
   auto [section, key, value] = *first;
   CHECK(section == "log");
   CHECK(key == "level");
   CHECK(value == "debug");

   auto dpi = rng::find_if(ini_file, [](auto& t) { return t._key == "dpi"; });
   REQUIRE(dpi != rng::end(ini_file));
   CHECK(dpi->_value == "144");
}

TEST_CASE("empty .ini") {
   wisp::INI_Parser empty("");
   CHECK(empty.begin() == empty.end());

   wisp::INI_Parser comments_only("; nothing\n# here\n");
   CHECK(comments_only.begin() == comments_only.end());
}

TEST_CASE("config from .ini") {
   wisp::Config cfg;
   cfg.parse(R"(
[log]
level = info
[display]
name = :2
dpi = 192
[window]
color_mode = light
[ui_thread]
name = my_ui
[unrelated]
level = off
)");
   CHECK(cfg.level == wisp::log_level::info);
   CHECK(cfg.display_name == ":2");
   CHECK(cfg.dpi == 192);
   CHECK(cfg.color_mode == wisp::ColorMode::light);
   CHECK(cfg.thread_name == "my_ui");
}

TEST_CASE("bad config values keep the defaults") {
   wisp::Config cfg;
   wisp::set_log_level(wisp::log_level::off); // silence the warning about color_mode
   cfg.parse("[log]\nlevel = loud\n[display]\ndpi = -5\n[window]\ncolor_mode = purple\n");
   CHECK(cfg.level == wisp::log_level::warning);
   CHECK(cfg.dpi == 0);
   CHECK(cfg.color_mode == wisp::ColorMode::system);
}

TEST_CASE("config file loading") {
   auto path = std::filesystem::temp_directory_path() / "wisp_config_tests.ini";
   {
      std::ofstream ofs(path);
      ofs << "[display]\ndpi = 120\n";
   }
   ::unsetenv("WISP_LOG_LEVEL");
   auto cfg = wisp::Config::load(path);
   CHECK(cfg.dpi == 120);

   ::setenv("WISP_LOG_LEVEL", "error", 1);
   cfg = wisp::Config::load(path);
   CHECK(cfg.level == wisp::log_level::error);
   ::unsetenv("WISP_LOG_LEVEL");

   std::filesystem::remove(path);
   cfg = wisp::Config::load(path);
   CHECK(cfg.dpi == 0);

   ::setenv("WISP_CONFIG", path.c_str(), 1);
   CHECK(wisp::Config::default_path() == path);
   ::unsetenv("WISP_CONFIG");
}

TEST_CASE("log levels") {
   CHECK(wisp::parse_log_level("debug", wisp::log_level::off) == wisp::log_level::debug);
   CHECK(wisp::parse_log_level("warn", wisp::log_level::off) == wisp::log_level::warning);
   CHECK(wisp::parse_log_level("verbose", wisp::log_level::info) == wisp::log_level::info);

   wisp::set_log_level(wisp::log_level::warning);
   CHECK(wisp::log_enabled(wisp::log_level::error));
   CHECK(wisp::log_enabled(wisp::log_level::warning));
   CHECK(!wisp::log_enabled(wisp::log_level::info));
}

TEST_CASE("color modes") {
   CHECK(wisp::gtk_theme_is_dark("Adwaita:dark"));
   CHECK(!wisp::gtk_theme_is_dark("Adwaita"));
   CHECK(!wisp::gtk_theme_is_dark("dark"));
   CHECK(wisp::resolve_color_mode(wisp::ColorMode::system, wisp::ColorModeState::dark) == wisp::ColorModeState::dark);
   CHECK(wisp::resolve_color_mode(wisp::ColorMode::light, wisp::ColorModeState::dark) == wisp::ColorModeState::light);
}

TEST_CASE("error kinds") {
   wisp::Error e = wisp::Error::ui_thread_closed();
   CHECK(e.kind() == wisp::ErrorKind::ui_thread_closed);
   CHECK(wisp::to_string(e.kind()) == "ui_thread_closed");

   wisp::Error api(wisp::ErrorKind::api, "XCreateWindow failed");
   CHECK(std::string(api.what()) == "XCreateWindow failed");
}
