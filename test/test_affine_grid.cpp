#include <datapod/datapod.hpp>
namespace dp = datapod;
#include "griffine/griffine.hpp"
#include <doctest/doctest.h>

#include <vector>

namespace {
    const griffine::Affine utm_like(10, 0, 200000, 0, -10, 6100000);
}

TEST_CASE("Affine cell corners") {
    auto grid = griffine::Grid(10000, 5000).add_transform(utm_like);

    SUBCASE("First cell") {
        auto cell = grid.cell_at(0, 0);
        CHECK(cell.origin() == griffine::Point(200000, 6100000));
        CHECK(cell.centroid() == griffine::Point(200005, 6099995));
        CHECK(cell.antiorigin() == griffine::Point(200010, 6099990));
        CHECK(cell.cell() == griffine::Cell(0, 0));
        CHECK(cell.transform() == utm_like);
    }

    SUBCASE("Grid-level accessors agree with the cell") {
        griffine::Cell cell(1234, 4321);
        CHECK(grid.origin_of(cell) == griffine::Point(212340, 6056790));
        CHECK(grid.centroid_of(cell) == griffine::Point(212345, 6056785));
        CHECK(grid.antiorigin_of(cell) == griffine::Point(212350, 6056780));
        CHECK(grid(1234, 4321).origin() == grid.origin_of(cell));
    }

    SUBCASE("Fractional grid coordinates") {
        CHECK(grid.point_at(2.5, 0.25) == griffine::Point(200025, 6099997.5));
        CHECK(grid.point_at(10000, 5000) == griffine::Point(300000, 6050000));
    }

    SUBCASE("Cells outside the grid are rejected") {
        CHECK_THROWS_AS(grid.cell_at(10000, 0), griffine::out_of_bounds_error);
        CHECK_THROWS_AS(grid.origin_of(griffine::Cell(0, 5000)), griffine::out_of_bounds_error);
    }
}

TEST_CASE("Centroid is the midpoint of origin and antiorigin") {
    for (const auto &transform : std::vector<griffine::Affine>{
             utm_like, griffine::Affine(0.5, 0, -180, 0, -0.25, 90), griffine::Affine::identity()}) {
        auto grid = griffine::Grid(64, 32).add_transform(transform);
        for (std::size_t row = 0; row < grid.rows(); row += 7) {
            for (std::size_t col = 0; col < grid.cols(); col += 9) {
                auto cell = grid.cell_at(col, row);
                auto origin = cell.origin();
                auto antiorigin = cell.antiorigin();
                CHECK(cell.centroid() ==
                      griffine::Point((origin.x() + antiorigin.x()) / 2, (origin.y() + antiorigin.y()) / 2));
            }
        }
    }
}

TEST_CASE("Cell containing a point") {
    auto grid = griffine::Grid(10000, 5000).add_transform(utm_like);

    SUBCASE("Origin resolves back to its own cell") {
        for (const auto &cell : std::vector<griffine::Cell>{{0, 0}, {1, 0}, {0, 1}, {1234, 4321}, {9999, 4999}}) {
            CHECK(grid.cell_containing(grid.origin_of(cell)).cell() == cell);
        }
    }

    SUBCASE("Centroid and interior points") {
        CHECK(grid.cell_containing(griffine::Point(200005, 6099995)).cell() == griffine::Cell(0, 0));
        CHECK(grid.cell_containing(griffine::Point(200019.99, 6099980.01)).cell() == griffine::Cell(1, 1));
    }

    SUBCASE("Boundaries belong to the following cell") {
        CHECK(grid.cell_containing(griffine::Point(200010, 6100000)).cell() == griffine::Cell(1, 0));
        CHECK(grid.cell_containing(griffine::Point(200000, 6099990)).cell() == griffine::Cell(0, 1));
    }

    SUBCASE("Result carries the grid transform") {
        auto cell = grid.cell_containing(griffine::Point(200125, 6099955));
        CHECK(cell.cell() == griffine::Cell(12, 4));
        CHECK(cell.transform() == utm_like);
        CHECK(cell.origin() == griffine::Point(200120, 6099960));
    }

    SUBCASE("Points outside the footprint are rejected") {
        CHECK_THROWS_AS(grid.cell_containing(griffine::Point(199999.9, 6099995)), griffine::out_of_bounds_error);
        CHECK_THROWS_AS(grid.cell_containing(griffine::Point(200005, 6100000.1)), griffine::out_of_bounds_error);
        // The antiorigin of the last cell lies on the far edge
        CHECK_THROWS_AS(grid.cell_containing(grid.antiorigin_of(griffine::Cell(9999, 4999))),
                        griffine::out_of_bounds_error);
    }

    SUBCASE("Point-like inputs") {
        CHECK(grid.cell_containing(dp::Point{200005.0, 6099995.0, 12.0}).cell() == griffine::Cell(0, 0));
    }

    SUBCASE("Rotated transform") {
        auto rotated = griffine::Grid(50, 40).add_transform(griffine::Affine(2, 1, 100, -1, 3, 50));
        for (std::size_t row = 0; row < rotated.rows(); row += 3) {
            for (std::size_t col = 0; col < rotated.cols(); col += 4) {
                griffine::Cell cell(col, row);
                CHECK(rotated.cell_containing(rotated.origin_of(cell)).cell() == cell);
                CHECK(rotated.cell_containing(rotated.centroid_of(cell)).cell() == cell);
            }
        }
    }

    SUBCASE("Degenerate transform") {
        auto flat = griffine::Grid(10, 10).add_transform(griffine::Affine(1, 2, 0, 2, 4, 0));
        CHECK(flat.cell_at(1, 1).origin() == griffine::Point(3, 6));
        CHECK_THROWS_AS(flat.cell_containing(griffine::Point(0, 0)), griffine::degenerate_transform_error);
    }
}

TEST_CASE("Cell corners resolve to their own cell under fractional transforms") {
    // 1 arc-second geographic grid, a decimal-scaled grid and a rotated grid
    const std::vector<griffine::Affine> transforms{
        griffine::Affine(0.000277777777778, 0, -180.000138888889, 0, -0.000277777777778, 90.000138888889),
        griffine::Affine(0.1, 0, 0.3, 0, -0.1, 0.7),
        griffine::Affine(8.66, -5, 1000.3, 5, 8.66, 2000.7),
        griffine::Affine(30, 0, 399960, 0, -30, 4500000)};

    for (const auto &transform : transforms) {
        CAPTURE(transform);
        auto grid = griffine::Grid(1000, 1000).add_transform(transform);

        std::size_t mismatches = 0;
        for (std::size_t row = 0; row < grid.rows(); ++row) {
            for (std::size_t col = 0; col < grid.cols(); ++col) {
                griffine::Cell cell(col, row);
                if (grid.cell_containing(grid.origin_of(cell)).cell() != cell) {
                    ++mismatches;
                }
            }
        }
        CHECK(mismatches == 0);
    }
}

TEST_CASE("Points on a grid line belong to the cell starting there") {
    auto grid = griffine::Grid(1000, 1000).add_transform(
        griffine::Affine(0.000277777777778, 0, -180.000138888889, 0, -0.000277777777778, 90.000138888889));

    for (std::size_t i = 1; i < 1000; i += 37) {
        // Vertical line through the left edge of column i, half way down row 3
        griffine::Point on_column_edge(grid.origin_of(griffine::Cell(i, 3)).x(),
                                       grid.centroid_of(griffine::Cell(i, 3)).y());
        CHECK(grid.cell_containing(on_column_edge).cell() == griffine::Cell(i, 3));

        // Horizontal line through the top edge of row i, half way across column 5
        griffine::Point on_row_edge(grid.centroid_of(griffine::Cell(5, i)).x(),
                                    grid.origin_of(griffine::Cell(5, i)).y());
        CHECK(grid.cell_containing(on_row_edge).cell() == griffine::Cell(5, i));
    }
}
