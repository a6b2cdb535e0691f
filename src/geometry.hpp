#pragma once

#include <algorithm>
#include <cstdint>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace wisp {

inline constexpr uint32_t default_dpi = 96;

// coordinate space tags
// ---------------------
struct logical {};
struct physical {};
struct screen {};

namespace detail {
// integers truncate toward zero (64 bit intermediate), floats are scaled exactly
template <class T>
constexpr T scale(T v, uint32_t num, uint32_t den) {
   if constexpr (std::is_floating_point_v<T>)
      return v * static_cast<T>(num) / static_cast<T>(den);
   else
      return static_cast<T>(static_cast<int64_t>(v) * num / den);
}
} // namespace detail

// ---------------------------------------------------------------------------
template <class T, class Coord>
struct Position {
   T x{};
   T y{};

   constexpr Position() = default;
   constexpr Position(T x_, T y_)
      : x(x_)
      , y(y_) {}

   constexpr Position<T, physical> to_physical(uint32_t dpi) const
      requires std::is_same_v<Coord, logical>
   {
      return {detail::scale(x, dpi, default_dpi), detail::scale(y, dpi, default_dpi)};
   }

   constexpr Position<T, screen> to_screen(uint32_t dpi) const
      requires std::is_same_v<Coord, logical>
   {
      return {detail::scale(x, dpi, default_dpi), detail::scale(y, dpi, default_dpi)};
   }

   constexpr Position<T, logical> to_logical(uint32_t dpi) const
      requires(!std::is_same_v<Coord, logical>)
   {
      return {detail::scale(x, default_dpi, dpi), detail::scale(y, default_dpi, dpi)};
   }

   template <class U>
   constexpr Position<U, Coord> cast() const {
      return {static_cast<U>(x), static_cast<U>(y)};
   }

   constexpr Position operator+(const Position& o) const { return {x + o.x, y + o.y}; }
   constexpr Position operator-(const Position& o) const { return {x - o.x, y - o.y}; }

   bool operator==(const Position&) const = default;
};

// ---------------------------------------------------------------------------
template <class T, class Coord>
struct Size {
   T width{};
   T height{};

   constexpr Size() = default;
   constexpr Size(T w, T h)
      : width(w)
      , height(h) {}

   constexpr Size<T, physical> to_physical(uint32_t dpi) const
      requires std::is_same_v<Coord, logical>
   {
      return {detail::scale(width, dpi, default_dpi), detail::scale(height, dpi, default_dpi)};
   }

   constexpr Size<T, logical> to_logical(uint32_t dpi) const
      requires(!std::is_same_v<Coord, logical>)
   {
      return {detail::scale(width, default_dpi, dpi), detail::scale(height, default_dpi, dpi)};
   }

   template <class U>
   constexpr Size<U, Coord> cast() const {
      return {static_cast<U>(width), static_cast<U>(height)};
   }

   bool operator==(const Size&) const = default;
};

// ---------------------------------------------------------------------------
template <class T, class Coord>
struct Rect {
   T left{};
   T top{};
   T right{};
   T bottom{};

   constexpr Rect() = default;
   constexpr Rect(T l, T t, T r, T b)
      : left(l)
      , top(t)
      , right(r)
      , bottom(b) {}
   constexpr Rect(Position<T, Coord> origin, Size<T, Coord> sz)
      : left(origin.x)
      , top(origin.y)
      , right(origin.x + sz.width)
      , bottom(origin.y + sz.height) {}

   constexpr Position<T, Coord> origin() const { return {left, top}; }
   constexpr Size<T, Coord>     size() const { return {right - left, bottom - top}; }
   constexpr bool               empty() const { return right <= left || bottom <= top; }

   constexpr bool contains(Position<T, Coord> p) const {
      return p.x >= left && p.x < right && p.y >= top && p.y < bottom;
   }

   // smallest rectangle enclosing both; an empty rectangle does not contribute
   constexpr Rect united(const Rect& o) const {
      if (empty())
         return o;
      if (o.empty())
         return *this;
      return {std::min(left, o.left), std::min(top, o.top), std::max(right, o.right), std::max(bottom, o.bottom)};
   }

   constexpr Rect<T, physical> to_physical(uint32_t dpi) const
      requires std::is_same_v<Coord, logical>
   {
      return {detail::scale(left, dpi, default_dpi), detail::scale(top, dpi, default_dpi),
              detail::scale(right, dpi, default_dpi), detail::scale(bottom, dpi, default_dpi)};
   }

   constexpr Rect<T, logical> to_logical(uint32_t dpi) const
      requires(!std::is_same_v<Coord, logical>)
   {
      return {detail::scale(left, default_dpi, dpi), detail::scale(top, default_dpi, dpi),
              detail::scale(right, default_dpi, dpi), detail::scale(bottom, default_dpi, dpi)};
   }

   bool operator==(const Rect&) const = default;
};

template <class T> using LogicalPosition  = Position<T, logical>;
template <class T> using PhysicalPosition = Position<T, physical>;
template <class T> using ScreenPosition   = Position<T, screen>;
template <class T> using LogicalSize      = Size<T, logical>;
template <class T> using PhysicalSize     = Size<T, physical>;
template <class T> using LogicalRect      = Rect<T, logical>;
template <class T> using PhysicalRect     = Rect<T, physical>;
template <class T> using ScreenRect       = Rect<T, screen>;

// ---------------------------------------------------------------------------
//                              json
// ---------------------------------------------------------------------------
template <class T, class C>
void to_json(nlohmann::json& j, const Position<T, C>& p) {
   j = nlohmann::json{{"x", p.x}, {"y", p.y}};
}

template <class T, class C>
void from_json(const nlohmann::json& j, Position<T, C>& p) {
   j.at("x").get_to(p.x);
   j.at("y").get_to(p.y);
}

template <class T, class C>
void to_json(nlohmann::json& j, const Size<T, C>& s) {
   j = nlohmann::json{{"width", s.width}, {"height", s.height}};
}

template <class T, class C>
void from_json(const nlohmann::json& j, Size<T, C>& s) {
   j.at("width").get_to(s.width);
   j.at("height").get_to(s.height);
}

template <class T, class C>
void to_json(nlohmann::json& j, const Rect<T, C>& r) {
   j = nlohmann::json{{"left", r.left}, {"top", r.top}, {"right", r.right}, {"bottom", r.bottom}};
}

template <class T, class C>
void from_json(const nlohmann::json& j, Rect<T, C>& r) {
   j.at("left").get_to(r.left);
   j.at("top").get_to(r.top);
   j.at("right").get_to(r.right);
   j.at("bottom").get_to(r.bottom);
}

} // namespace wisp
