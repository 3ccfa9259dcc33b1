#include "griffine/affine_grid.hpp"

#include <cmath>

#include "griffine/errors.hpp"

namespace griffine {

    AffineCell AffineGrid::cell_at(std::size_t col, std::size_t row) const {
        return AffineCell(grid_.cell_at(col, row), base_, offset_);
    }

    AffineCell AffineGrid::cell_containing(const Point &p) const {
        // Work in the base grid so a tile resolves points exactly as its parent does
        const auto [fcol, frow] = base_.apply_inverse(p);

        // The inverse of a corner can land an ulp short of its integer. A point the
        // forward map puts exactly on a grid line belongs to the cell starting there.
        const double ncol = std::round(fcol);
        const double nrow = std::round(frow);
        const Point corner = base_.apply(ncol, nrow);
        const bool on_corner = corner == p;

        const double gcol = (on_corner || (base_.b() == 0.0 && corner.x() == p.x())) ? ncol : std::floor(fcol);
        const double grow = (on_corner || (base_.d() == 0.0 && corner.y() == p.y())) ? nrow : std::floor(frow);

        const double col = gcol - static_cast<double>(offset_.col());
        const double row = grow - static_cast<double>(offset_.row());

        // Negated comparisons also reject NaN
        if (!(col >= 0.0 && col < static_cast<double>(grid_.cols()))) {
            throw out_of_bounds_error("column", col, grid_.cols());
        }
        if (!(row >= 0.0 && row < static_cast<double>(grid_.rows()))) {
            throw out_of_bounds_error("row", row, grid_.rows());
        }
        return AffineCell(Cell(static_cast<std::size_t>(col), static_cast<std::size_t>(row)), base_, offset_);
    }

    TiledAffineGrid AffineGrid::tile_via(const Size &tile_size) const {
        return TiledAffineGrid(grid_.tile_via(tile_size), transform_);
    }

    TiledAffineGrid AffineGrid::tile_via(const Grid &tile) const { return tile_via(tile.size()); }

    TiledAffineGrid AffineGrid::tile_into(const Grid &layout) const {
        return TiledAffineGrid(grid_.tile_into(layout), transform_);
    }

} // namespace griffine
