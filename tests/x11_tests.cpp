#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <event.hpp>
#include <x11.hpp>

#include <X11/cursorfont.h>

#include <set>

TEST_CASE("text/uri-list parsing") {
   SUBCASE("local files, CRLF separated") {
      auto paths = wisp::x11::parse_uri_list("file:///home/user/a.txt\r\nfile:///tmp/b%20c.png\r\n");
      REQUIRE(paths.size() == 2);
      CHECK(paths[0] == "/home/user/a.txt");
      CHECK(paths[1] == "/tmp/b c.png");
   }
   SUBCASE("host part, comments and other schemes") {
      auto paths = wisp::x11::parse_uri_list("# from a file manager\nfile://localhost/srv/x\nhttp://example.com/y\n");
      REQUIRE(paths.size() == 1);
      CHECK(paths[0] == "/srv/x");
   }
   SUBCASE("percent decoding") {
      auto paths = wisp::x11::parse_uri_list("file:///a%2Fb/%E2%82%AC%zz%4");
      REQUIRE(paths.size() == 1);
      CHECK(paths[0].native() == "/a/b/\xE2\x82\xAC%zz%4");
   }
   SUBCASE("empty") {
      CHECK(wisp::x11::parse_uri_list("").empty());
      CHECK(wisp::x11::parse_uri_list("\r\n\r\n").empty());
   }
}

TEST_CASE("Xft.dpi resource") {
   CHECK(wisp::x11::parse_xft_dpi("Xft.antialias:\t1\nXft.dpi:\t144\nXft.hinting:\t1\n") == 144u);
   CHECK(wisp::x11::parse_xft_dpi("Xft.dpi: 96.0") == 96u);
   CHECK(!wisp::x11::parse_xft_dpi("Xcursor.size: 24\n"));
   CHECK(!wisp::x11::parse_xft_dpi("Xft.dpi: 0\n"));
}

TEST_CASE("hit test values map to window manager move/resize directions") {
   using wisp::NcHitTestValue;
   using wisp::x11::MoveResize;

   CHECK(!wisp::x11::move_resize_for(NcHitTestValue::client));
   CHECK(wisp::x11::move_resize_for(NcHitTestValue::caption) == MoveResize::move);
   CHECK(wisp::x11::move_resize_for(NcHitTestValue::top_left) == MoveResize::size_topleft);
   CHECK(wisp::x11::move_resize_for(NcHitTestValue::bottom) == MoveResize::size_bottom);

   CHECK(!wisp::resizing_edge(NcHitTestValue::caption));
   CHECK(wisp::resizing_edge(NcHitTestValue::right) == wisp::ResizingEdge::right);
   CHECK(wisp::resizing_edge(NcHitTestValue::bottom_right) == wisp::ResizingEdge::bottom_right);
}

TEST_CASE("keysyms") {
   CHECK(wisp::virtual_key_from_keysym(XK_a) == wisp::VirtualKey::A);
   CHECK(wisp::virtual_key_from_keysym(XK_Q) == static_cast<wisp::VirtualKey>(XK_Q));
   CHECK(wisp::virtual_key_from_keysym(XK_KP_7) == static_cast<wisp::VirtualKey>(XK_7));
   CHECK(wisp::virtual_key_from_keysym(XK_KP_Enter) == wisp::VirtualKey::ENTER);
   CHECK(wisp::virtual_key_from_keysym(XK_F5) == static_cast<wisp::VirtualKey>(XK_F5));
   CHECK(wisp::virtual_key_from_keysym(XK_ISO_Left_Tab) == wisp::VirtualKey::TAB);
   CHECK(wisp::virtual_key_from_keysym(XK_Control_R) == wisp::VirtualKey::CONTROL_R);
   CHECK(wisp::virtual_key_from_keysym(NoSymbol) == wisp::VirtualKey::unknown);
}

TEST_CASE("cursors use distinct font shapes") {
   std::set<unsigned int> shapes;
   for (uint32_t i = 0; i < static_cast<uint32_t>(wisp::Cursor::count); ++i)
      shapes.insert(wisp::x11::CursorCache::font_shape(static_cast<wisp::Cursor>(i)));
   CHECK(shapes.size() == static_cast<size_t>(wisp::Cursor::count));
   CHECK(wisp::x11::CursorCache::font_shape(wisp::Cursor::ibeam) == XC_xterm);

   // no display: nothing is created
   wisp::x11::CursorCache cache;
   CHECK(cache.get(wisp::Cursor::hand) == 0);
}

TEST_CASE("synthetic atoms are distinct and non zero") {
   auto            atoms = wisp::x11::Atoms::synthetic();
   std::set<Atom> seen;
   for (int i = 0; i < wisp::x11::atom_id_last; ++i) {
      auto a = atoms[static_cast<wisp::x11::atom_id_t>(i)];
      CHECK(a != 0);
      seen.insert(a);
   }
   CHECK(seen.size() == static_cast<size_t>(wisp::x11::atom_id_last));
}
