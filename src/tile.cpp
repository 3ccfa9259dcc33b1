#include "griffine/tile.hpp"

#include <algorithm>
#include <string>

#include "griffine/affine_grid.hpp"
#include "griffine/errors.hpp"

namespace griffine {

    namespace {
        Grid layout_for(const Grid &base, const Size &tile_size) {
            if (tile_size.cols < 1 || tile_size.cols > base.cols()) {
                throw configuration_error("tile cols", "1 to " + std::to_string(base.cols()),
                                          std::to_string(tile_size.cols));
            }
            if (tile_size.rows < 1 || tile_size.rows > base.rows()) {
                throw configuration_error("tile rows", "1 to " + std::to_string(base.rows()),
                                          std::to_string(tile_size.rows));
            }
            return Grid((base.cols() + tile_size.cols - 1) / tile_size.cols,
                        (base.rows() + tile_size.rows - 1) / tile_size.rows);
        }
    } // namespace

    Tile::Tile(const Cell &position, const Size &size, const Size &nominal_size)
        : cell_(position), grid_(size), nominal_size_(nominal_size) {
        if (size.cols > nominal_size.cols || size.rows > nominal_size.rows) {
            throw configuration_error("tile size", "at most the nominal size", "larger than nominal size");
        }
    }

    bool Tile::contains_global(const Cell &global) const {
        const Cell origin = offset();
        return global.col() >= origin.col() && global.row() >= origin.row() &&
               grid_.contains(global.col() - origin.col(), global.row() - origin.row());
    }

    Cell Tile::to_global(const Cell &local) const {
        detail::check_bounds(grid_.size(), local.col(), local.row());
        const Cell origin = offset();
        return Cell(origin.col() + local.col(), origin.row() + local.row());
    }

    Cell Tile::to_local(const Cell &global) const {
        const Cell origin = offset();
        if (global.col() < origin.col() || global.col() - origin.col() >= grid_.cols()) {
            throw out_of_bounds_error("column", global.col(), origin.col() + grid_.cols());
        }
        if (global.row() < origin.row() || global.row() - origin.row() >= grid_.rows()) {
            throw out_of_bounds_error("row", global.row(), origin.row() + grid_.rows());
        }
        return Cell(global.col() - origin.col(), global.row() - origin.row());
    }

    TiledGrid::TiledGrid(const Grid &base, const Size &tile_size)
        : base_(base), tile_size_(tile_size), layout_(layout_for(base, tile_size)) {}

    Tile TiledGrid::tile_at(std::size_t col, std::size_t row) const {
        detail::check_bounds(layout_.size(), col, row);

        // Last column and row keep whatever the base extent leaves over
        const std::size_t cols = std::min(tile_size_.cols, base_.cols() - col * tile_size_.cols);
        const std::size_t rows = std::min(tile_size_.rows, base_.rows() - row * tile_size_.rows);
        return Tile(Cell(col, row), Size{cols, rows}, tile_size_);
    }

    Tile TiledGrid::tile_containing(const Cell &cell) const {
        detail::check_bounds(base_.size(), cell.col(), cell.row());
        return tile_at(cell.col() / tile_size_.cols, cell.row() / tile_size_.rows);
    }

    TiledAffineGrid TiledGrid::add_transform(const Affine &transform) const { return TiledAffineGrid(*this, transform); }

} // namespace griffine
