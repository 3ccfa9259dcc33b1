#pragma once

#include <iosfwd>
#include <type_traits>
#include <utility>

#include <datapod/datapod.hpp>

namespace dp = datapod;

namespace griffine {

    namespace detail {
        template <typename T, typename = void> struct has_xy_view : std::false_type {};

        template <typename T>
        struct has_xy_view<T, std::void_t<decltype(std::declval<const T &>().xy().first),
                                          decltype(std::declval<const T &>().xy().second)>> : std::true_type {};

        template <typename T, typename = void> struct has_xy_members : std::false_type {};

        template <typename T>
        struct has_xy_members<T, std::void_t<decltype(std::declval<const T &>().x),
                                             decltype(std::declval<const T &>().y)>> : std::true_type {};
    } // namespace detail

    /// True for any type exposing an (x, y) pair through `xy()` or through `x` / `y` members
    template <typename T>
    inline constexpr bool is_point_like_v =
        detail::has_xy_view<std::decay_t<T>>::value || detail::has_xy_members<std::decay_t<T>>::value;

    /// A position in model space
    class Point {
      public:
        Point() = default;
        Point(double x, double y) : x_(x), y_(y) {}

        double x() const { return x_; }
        double y() const { return y_; }

        /// Coordinate pair view shared with external geometry types
        std::pair<double, double> xy() const { return {x_, y_}; }

        dp::Point to_datapod() const { return dp::Point{x_, y_, 0.0}; }

        bool operator==(const Point &other) const { return x_ == other.x_ && y_ == other.y_; }
        bool operator!=(const Point &other) const { return !(*this == other); }

      private:
        double x_ = 0.0;
        double y_ = 0.0;
    };

    template <typename P> Point to_point(const P &p) {
        static_assert(is_point_like_v<P>, "to_point requires a type with xy() or x/y members");
        if constexpr (std::is_same_v<P, Point>) {
            return p;
        } else if constexpr (detail::has_xy_view<P>::value) {
            const auto [x, y] = p.xy();
            return Point{static_cast<double>(x), static_cast<double>(y)};
        } else {
            return Point{static_cast<double>(p.x), static_cast<double>(p.y)};
        }
    }

    std::ostream &operator<<(std::ostream &os, const Point &p);

} // namespace griffine
