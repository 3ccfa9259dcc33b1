#pragma once

#include <cstddef>
#include <type_traits>

#include "griffine/affine.hpp"
#include "griffine/grid.hpp"
#include "griffine/point.hpp"
#include "griffine/tile.hpp"

namespace griffine {

    template <typename P> using enable_if_point_like_t = std::enable_if_t<is_point_like_v<P>, int>;

    /// A cell paired with the transform of the grid it was taken from. A cell of
    /// a sub-grid keeps the base transform and the sub-grid's offset, and maps
    /// through the base transform at its global position.
    class AffineCell {
      public:
        AffineCell(const Cell &cell, const Affine &transform) : AffineCell(cell, transform, Cell(0, 0)) {}
        AffineCell(const Cell &cell, const Affine &base_transform, const Cell &offset)
            : cell_(cell), offset_(offset), base_(base_transform),
              transform_(base_transform.shifted(offset.col(), offset.row())) {}

        const Cell &cell() const { return cell_; }
        /// Transform of the grid the cell belongs to
        const Affine &transform() const { return transform_; }
        std::size_t col() const { return cell_.col(); }
        std::size_t row() const { return cell_.row(); }

        /// Top-left corner
        Point origin() const { return base_.apply(global_col(), global_row()); }
        Point centroid() const { return base_.apply(global_col() + 0.5, global_row() + 0.5); }
        /// Bottom-right corner
        Point antiorigin() const { return base_.apply(global_col() + 1.0, global_row() + 1.0); }

        bool operator==(const AffineCell &other) const {
            return cell_ == other.cell_ && offset_ == other.offset_ && base_ == other.base_;
        }
        bool operator!=(const AffineCell &other) const { return !(*this == other); }

      private:
        Cell cell_;
        Cell offset_;
        Affine base_;
        Affine transform_;

        double global_col() const { return static_cast<double>(offset_.col() + cell_.col()); }
        double global_row() const { return static_cast<double>(offset_.row() + cell_.row()); }
    };

    class TiledAffineGrid;

    /// A grid placed in model space by an affine transform
    class AffineGrid {
      public:
        AffineGrid(const Grid &grid, const Affine &transform) : AffineGrid(grid, transform, Cell(0, 0)) {}

        /// Sub-grid whose cell (0, 0) is cell `offset` of a grid placed by `base_transform`
        AffineGrid(const Grid &grid, const Affine &base_transform, const Cell &offset)
            : grid_(grid), offset_(offset), base_(base_transform),
              transform_(base_transform.shifted(offset.col(), offset.row())) {}

        const Grid &grid() const { return grid_; }
        const Affine &transform() const { return transform_; }
        std::size_t cols() const { return grid_.cols(); }
        std::size_t rows() const { return grid_.rows(); }
        Size size() const { return grid_.size(); }
        bool contains(std::size_t col, std::size_t row) const { return grid_.contains(col, row); }

        /// Throws out_of_bounds_error
        AffineCell cell_at(std::size_t col, std::size_t row) const;
        AffineCell operator()(std::size_t col, std::size_t row) const { return cell_at(col, row); }

        /// Model-space position of a fractional grid coordinate; not bounds checked
        Point point_at(double col, double row) const {
            return base_.apply(static_cast<double>(offset_.col()) + col, static_cast<double>(offset_.row()) + row);
        }

        Point origin_of(const Cell &cell) const { return cell_at(cell.col(), cell.row()).origin(); }
        Point centroid_of(const Cell &cell) const { return cell_at(cell.col(), cell.row()).centroid(); }
        Point antiorigin_of(const Cell &cell) const { return cell_at(cell.col(), cell.row()).antiorigin(); }

        /// Cell whose half-open footprint [col, col + 1) x [row, row + 1) holds the point.
        /// Throws out_of_bounds_error or degenerate_transform_error.
        AffineCell cell_containing(const Point &p) const;

        template <typename P, enable_if_point_like_t<P> = 0> AffineCell cell_containing(const P &p) const {
            return cell_containing(to_point(p));
        }

        TiledAffineGrid tile_via(const Size &tile_size) const;
        TiledAffineGrid tile_via(const Grid &tile) const;
        TiledAffineGrid tile_into(const Grid &layout) const;

        bool operator==(const AffineGrid &other) const {
            return grid_ == other.grid_ && offset_ == other.offset_ && base_ == other.base_;
        }
        bool operator!=(const AffineGrid &other) const { return !(*this == other); }

      private:
        Grid grid_;
        Cell offset_;
        Affine base_;
        Affine transform_;
    };

    /// A tile of a TiledAffineGrid. Its transform is the parent transform
    /// shifted to the tile's top-left global cell; its cells map through the
    /// parent transform at their global position, so local and global lookups
    /// land on the same model-space coordinates.
    class AffineTile {
      public:
        AffineTile(const Tile &tile, const Affine &parent_transform)
            : tile_(tile), parent_transform_(parent_transform),
              grid_(tile.grid(), parent_transform, tile.offset()) {}

        const Tile &tile() const { return tile_; }
        const AffineGrid &affine_grid() const { return grid_; }
        const Cell &cell() const { return tile_.cell(); }
        const Grid &grid() const { return tile_.grid(); }

        std::size_t col() const { return tile_.col(); }
        std::size_t row() const { return tile_.row(); }
        std::size_t cols() const { return tile_.cols(); }
        std::size_t rows() const { return tile_.rows(); }
        Size size() const { return tile_.size(); }
        const Size &nominal_size() const { return tile_.nominal_size(); }
        Cell offset() const { return tile_.offset(); }

        /// Local transform
        const Affine &transform() const { return grid_.transform(); }
        const Affine &parent_transform() const { return parent_transform_; }

        /// Local cell
        AffineCell cell_at(std::size_t col, std::size_t row) const { return grid_.cell_at(col, row); }
        AffineCell operator()(std::size_t col, std::size_t row) const { return cell_at(col, row); }

        /// Global cell for local indices, mapped by the parent transform
        AffineCell global_cell_at(std::size_t col, std::size_t row) const {
            return AffineCell(tile_.to_global(tile_.cell_at(col, row)), parent_transform_);
        }

        /// Footprint of the whole tile
        Point origin() const { return grid_.point_at(0.0, 0.0); }
        Point centroid() const { return grid_.point_at(tile_.cols() / 2.0, tile_.rows() / 2.0); }
        Point antiorigin() const {
            return grid_.point_at(static_cast<double>(tile_.cols()), static_cast<double>(tile_.rows()));
        }

        /// Local cell holding the point
        AffineCell cell_containing(const Point &p) const { return grid_.cell_containing(p); }

        template <typename P, enable_if_point_like_t<P> = 0> AffineCell cell_containing(const P &p) const {
            return cell_containing(to_point(p));
        }

        bool operator==(const AffineTile &other) const {
            return tile_ == other.tile_ && parent_transform_ == other.parent_transform_;
        }
        bool operator!=(const AffineTile &other) const { return !(*this == other); }

      private:
        Tile tile_;
        Affine parent_transform_;
        AffineGrid grid_;
    };

    /// A tiled grid placed in model space. Also usable as an AffineGrid over
    /// the whole base extent through affine_grid().
    class TiledAffineGrid {
      public:
        TiledAffineGrid(const TiledGrid &tiled, const Affine &transform)
            : tiled_(tiled), grid_(tiled.base(), transform) {}

        const TiledGrid &tiled() const { return tiled_; }
        const AffineGrid &affine_grid() const { return grid_; }
        const Affine &transform() const { return grid_.transform(); }
        const Grid &base() const { return tiled_.base(); }

        std::size_t cols() const { return tiled_.cols(); }
        std::size_t rows() const { return tiled_.rows(); }
        Size size() const { return tiled_.size(); }
        const Size &tile_size() const { return tiled_.tile_size(); }
        std::size_t tile_count() const { return tiled_.tile_count(); }

        /// Throws out_of_bounds_error
        AffineTile tile_at(std::size_t col, std::size_t row) const {
            return AffineTile(tiled_.tile_at(col, row), grid_.transform());
        }
        AffineTile operator()(std::size_t col, std::size_t row) const { return tile_at(col, row); }

        AffineTile tile_containing(const Cell &cell) const {
            return AffineTile(tiled_.tile_containing(cell), grid_.transform());
        }

        AffineTile tile_containing(const Point &p) const { return tile_containing(grid_.cell_containing(p).cell()); }

        template <typename P, enable_if_point_like_t<P> = 0> AffineTile tile_containing(const P &p) const {
            return tile_containing(to_point(p));
        }

        /// Global cell holding the point
        AffineCell cell_containing(const Point &p) const { return grid_.cell_containing(p); }

        template <typename P, enable_if_point_like_t<P> = 0> AffineCell cell_containing(const P &p) const {
            return cell_containing(to_point(p));
        }

        bool operator==(const TiledAffineGrid &other) const {
            return tiled_ == other.tiled_ && grid_ == other.grid_;
        }
        bool operator!=(const TiledAffineGrid &other) const { return !(*this == other); }

      private:
        TiledGrid tiled_;
        AffineGrid grid_;
    };

} // namespace griffine
