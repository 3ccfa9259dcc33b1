#include "griffine/grid.hpp"

#include <ostream>
#include <string>

#include "griffine/affine_grid.hpp"
#include "griffine/errors.hpp"
#include "griffine/tile.hpp"

namespace griffine {

    namespace detail {

        void check_bounds(const Size &extent, std::size_t col, std::size_t row) {
            if (col >= extent.cols) {
                throw out_of_bounds_error("column", col, extent.cols);
            }
            if (row >= extent.rows) {
                throw out_of_bounds_error("row", row, extent.rows);
            }
        }

        namespace {
            std::size_t ceil_div(std::size_t n, std::size_t d) { return (n + d - 1) / d; }

            // Not every count is reachable with one nominal size: 10 cells into 7
            // tiles needs size ceil(10 / 7) = 2, which yields 5 tiles.
            bool can_tile_into(std::size_t extent, std::size_t count) {
                return count <= extent && count == ceil_div(extent, ceil_div(extent, count));
            }
        } // namespace

        Size tile_size_for_layout(const Size &extent, const Size &layout) {
            if (!can_tile_into(extent.cols, layout.cols)) {
                throw configuration_error("tile layout columns",
                                          "a count reachable by tiling " + std::to_string(extent.cols) + " columns",
                                          std::to_string(layout.cols));
            }
            if (!can_tile_into(extent.rows, layout.rows)) {
                throw configuration_error("tile layout rows",
                                          "a count reachable by tiling " + std::to_string(extent.rows) + " rows",
                                          std::to_string(layout.rows));
            }
            return Size{ceil_div(extent.cols, layout.cols), ceil_div(extent.rows, layout.rows)};
        }

    } // namespace detail

    Grid::Grid(std::size_t cols, std::size_t rows) : cols_(cols), rows_(rows) {
        if (cols_ < 1) {
            throw configuration_error("grid cols", "1 or greater", std::to_string(cols_));
        }
        if (rows_ < 1) {
            throw configuration_error("grid rows", "1 or greater", std::to_string(rows_));
        }
    }

    Cell Grid::cell_at(std::size_t col, std::size_t row) const {
        detail::check_bounds(size(), col, row);
        return Cell(col, row);
    }

    std::size_t Grid::linear_index(const Cell &cell) const {
        detail::check_bounds(size(), cell.col(), cell.row());
        return cell.row() * cols_ + cell.col();
    }

    Cell Grid::cell_at_index(std::size_t index) const {
        if (index >= cell_count()) {
            throw out_of_bounds_error("index", index, cell_count());
        }
        return Cell(index % cols_, index / cols_);
    }

    TiledGrid Grid::tile_via(const Size &tile_size) const { return TiledGrid(*this, tile_size); }

    TiledGrid Grid::tile_via(const Grid &tile) const { return tile_via(tile.size()); }

    TiledGrid Grid::tile_into(const Grid &layout) const {
        return TiledGrid(*this, detail::tile_size_for_layout(size(), layout.size()));
    }

    AffineGrid Grid::add_transform(const Affine &transform) const { return AffineGrid(*this, transform); }

    std::ostream &operator<<(std::ostream &os, const Size &size) {
        return os << "(" << size.cols << ", " << size.rows << ")";
    }

    std::ostream &operator<<(std::ostream &os, const Cell &cell) {
        return os << "Cell(" << cell.col() << ", " << cell.row() << ")";
    }

} // namespace griffine
