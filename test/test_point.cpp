#include <datapod/datapod.hpp>
namespace dp = datapod;
#include "griffine/griffine.hpp"
#include <doctest/doctest.h>

#include <utility>

namespace {
    struct PairPoint {
        double east;
        double north;
        std::pair<double, double> xy() const { return {east, north}; }
    };

    struct MemberPoint {
        float x;
        float y;
    };

    struct NotAPoint {
        double lat;
        double lon;
    };
} // namespace

static_assert(griffine::is_point_like_v<griffine::Point>);
static_assert(griffine::is_point_like_v<dp::Point>);
static_assert(griffine::is_point_like_v<PairPoint>);
static_assert(griffine::is_point_like_v<MemberPoint>);
static_assert(!griffine::is_point_like_v<NotAPoint>);
static_assert(!griffine::is_point_like_v<griffine::Cell>);

TEST_CASE("Point values") {
    griffine::Point p(200000.0, 6100000.0);
    CHECK(p.x() == 200000.0);
    CHECK(p.y() == 6100000.0);
    CHECK(p.xy() == std::make_pair(200000.0, 6100000.0));

    CHECK(p == griffine::Point(200000.0, 6100000.0));
    CHECK(p != griffine::Point(200000.0, 6099999.0));
    CHECK(griffine::Point() == griffine::Point(0.0, 0.0));
}

TEST_CASE("Point interchange") {
    SUBCASE("From an xy() view") {
        auto p = griffine::to_point(PairPoint{3.5, -2.25});
        CHECK(p == griffine::Point(3.5, -2.25));
    }

    SUBCASE("From x/y members") {
        auto p = griffine::to_point(MemberPoint{1.5f, 2.5f});
        CHECK(p == griffine::Point(1.5, 2.5));
    }

    SUBCASE("Datapod points") {
        auto p = griffine::to_point(dp::Point{12.0, 34.0, 56.0});
        CHECK(p == griffine::Point(12.0, 34.0));

        auto back = griffine::Point(7.0, 8.0).to_datapod();
        CHECK(back.x == 7.0);
        CHECK(back.y == 8.0);
        CHECK(back.z == 0.0);
    }
}
