#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <geometry.hpp>

#include <nlohmann/json.hpp>

TEST_CASE("logical to physical and back") {
   wisp::LogicalSize<int> sz{128, 64};

   auto phys = sz.to_physical(192);
   CHECK(phys == wisp::PhysicalSize<int>{256, 128});
   CHECK(phys.to_logical(192) == sz);

   // dpi multiples are exact for any value
   for (int v : {0, 1, 7, 95, 1023, -40}) {
      wisp::LogicalPosition<int> p{v, -v};
      for (uint32_t dpi : {96u, 192u, 288u, 384u})
         CHECK(p.to_physical(dpi).to_logical(dpi) == p);
   }
}

TEST_CASE("integer conversions truncate toward zero") {
   // 11 * 120 / 96 = 13.75, 13 * 96 / 120 = 10.4
   wisp::LogicalPosition<int> p{11, 11};
   auto                       phys = p.to_physical(120);
   CHECK(phys.x == 13);
   CHECK(phys.to_logical(120).x == 10);

   wisp::LogicalPosition<int> n{-11, 0};
   CHECK(n.to_physical(120).x == -13);

   // no overflow in the intermediate product
   wisp::LogicalSize<int> big{30'000'000, 1};
   CHECK(big.to_physical(192).width == 60'000'000);
}

TEST_CASE("floating point conversions do not round") {
   wisp::LogicalPosition<float> p{10.f, 1.f};
   auto                         phys = p.to_physical(144);
   CHECK(phys.x == doctest::Approx(15.f));
   CHECK(phys.y == doctest::Approx(1.5f));
   CHECK(phys.to_logical(144).y == doctest::Approx(1.f));
}

TEST_CASE("screen positions") {
   wisp::LogicalPosition<int> p{100, 50};
   CHECK(p.to_screen(192) == wisp::ScreenPosition<int>{200, 100});
   CHECK(wisp::ScreenPosition<int>{200, 100}.to_logical(192) == p);
}

TEST_CASE("rect operations") {
   wisp::PhysicalRect<int> a({10, 10}, {20, 10});
   CHECK(a.right == 30);
   CHECK(a.bottom == 20);
   CHECK(a.size() == wisp::PhysicalSize<int>{20, 10});
   CHECK(a.origin() == wisp::PhysicalPosition<int>{10, 10});
   CHECK(a.contains({10, 10}));
   CHECK(!a.contains({30, 10}));

   wisp::PhysicalRect<int> b(0, 15, 12, 40);
   auto                    u = a.united(b);
   CHECK(u == wisp::PhysicalRect<int>(0, 10, 30, 40));

   wisp::PhysicalRect<int> empty;
   CHECK(empty.empty());
   CHECK(empty.united(a) == a);
   CHECK(a.united(empty) == a);

   wisp::LogicalRect<int> l(1, 2, 3, 4);
   CHECK(l.to_physical(192) == wisp::PhysicalRect<int>(2, 4, 6, 8));
}

TEST_CASE("json serialization") {
   nlohmann::json j = wisp::PhysicalPosition<int>{3, -4};
   CHECK(j["x"] == 3);
   CHECK(j["y"] == -4);

   auto sz = nlohmann::json::parse(R"({"width": 640, "height": 480})").get<wisp::LogicalSize<int>>();
   CHECK(sz == wisp::LogicalSize<int>{640, 480});

   nlohmann::json jr = wisp::PhysicalRect<int>(1, 2, 3, 4);
   CHECK(jr.dump() == R"({"bottom":4,"left":1,"right":3,"top":2})");
   CHECK(jr.get<wisp::PhysicalRect<int>>() == wisp::PhysicalRect<int>(1, 2, 3, 4));

   CHECK_THROWS(nlohmann::json::parse(R"({"x": 1})").get<wisp::ScreenPosition<int>>());
}
