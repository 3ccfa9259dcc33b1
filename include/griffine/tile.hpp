#pragma once

#include <cstddef>

#include "griffine/grid.hpp"

namespace griffine {

    class TiledAffineGrid;

    /// One tile of a TiledGrid. It is both a cell of the tile grid (its
    /// position) and a grid of its own (its actual, possibly truncated, size).
    class Tile {
      public:
        Tile(const Cell &position, const Size &size, const Size &nominal_size);

        /// Position in the tile grid
        const Cell &cell() const { return cell_; }
        /// Local grid, sized to the cells this tile actually covers
        const Grid &grid() const { return grid_; }

        std::size_t col() const { return cell_.col(); }
        std::size_t row() const { return cell_.row(); }
        std::size_t cols() const { return grid_.cols(); }
        std::size_t rows() const { return grid_.rows(); }
        Size size() const { return grid_.size(); }
        const Size &nominal_size() const { return nominal_size_; }

        /// Smaller than the nominal size in at least one dimension
        bool is_truncated() const { return size() != nominal_size_; }

        /// Global cell at the tile's top-left corner
        Cell offset() const { return Cell(cell_.col() * nominal_size_.cols, cell_.row() * nominal_size_.rows); }

        Cell cell_at(std::size_t col, std::size_t row) const { return grid_.cell_at(col, row); }
        Cell operator()(std::size_t col, std::size_t row) const { return cell_at(col, row); }

        bool contains_global(const Cell &global) const;
        Cell to_global(const Cell &local) const;
        Cell to_local(const Cell &global) const;

        bool operator==(const Tile &other) const {
            return cell_ == other.cell_ && grid_ == other.grid_ && nominal_size_ == other.nominal_size_;
        }
        bool operator!=(const Tile &other) const { return !(*this == other); }

      private:
        Cell cell_;
        Grid grid_;
        Size nominal_size_;
    };

    /// A grid whose cells are tiles of an underlying base grid
    class TiledGrid {
      public:
        /// Throws configuration_error if the tile size is zero or exceeds the base grid
        TiledGrid(const Grid &base, const Size &tile_size);

        const Grid &base() const { return base_; }
        /// The tile grid itself, one cell per tile
        const Grid &grid() const { return layout_; }

        std::size_t cols() const { return layout_.cols(); }
        std::size_t rows() const { return layout_.rows(); }
        Size size() const { return layout_.size(); }
        const Size &tile_size() const { return tile_size_; }
        std::size_t tile_count() const { return layout_.cell_count(); }

        /// Throws out_of_bounds_error
        Tile tile_at(std::size_t col, std::size_t row) const;
        Tile operator()(std::size_t col, std::size_t row) const { return tile_at(col, row); }

        /// Tile covering a global cell of the base grid. Throws out_of_bounds_error.
        Tile tile_containing(const Cell &cell) const;

        TiledAffineGrid add_transform(const Affine &transform) const;

        bool operator==(const TiledGrid &other) const { return base_ == other.base_ && tile_size_ == other.tile_size_; }
        bool operator!=(const TiledGrid &other) const { return !(*this == other); }

      private:
        Grid base_;
        Size tile_size_;
        Grid layout_;
    };

} // namespace griffine
