#pragma once

#include <cstddef>
#include <iosfwd>

namespace griffine {

    class Affine;
    class AffineGrid;
    class TiledGrid;

    /// Extent in cells, columns first
    struct Size {
        std::size_t cols = 1;
        std::size_t rows = 1;

        bool operator==(const Size &other) const { return cols == other.cols && rows == other.rows; }
        bool operator!=(const Size &other) const { return !(*this == other); }
    };

    /// Address of one cell, relative to the top-left of the grid it was taken from
    class Cell {
      public:
        Cell(std::size_t col, std::size_t row) : col_(col), row_(row) {}

        std::size_t col() const { return col_; }
        std::size_t row() const { return row_; }

        bool operator==(const Cell &other) const { return col_ == other.col_ && row_ == other.row_; }
        bool operator!=(const Cell &other) const { return !(*this == other); }

      private:
        std::size_t col_;
        std::size_t row_;
    };

    /// Rectangular block of cells. Columns grow rightward, rows grow downward,
    /// and every lookup takes the column first.
    class Grid {
      public:
        /// Throws configuration_error when either dimension is zero
        Grid(std::size_t cols, std::size_t rows);
        explicit Grid(const Size &size) : Grid(size.cols, size.rows) {}

        std::size_t cols() const { return cols_; }
        std::size_t rows() const { return rows_; }
        Size size() const { return Size{cols_, rows_}; }
        std::size_t cell_count() const { return cols_ * rows_; }

        bool contains(std::size_t col, std::size_t row) const { return col < cols_ && row < rows_; }
        bool contains(const Cell &cell) const { return contains(cell.col(), cell.row()); }

        /// Throws out_of_bounds_error
        Cell cell_at(std::size_t col, std::size_t row) const;
        Cell operator()(std::size_t col, std::size_t row) const { return cell_at(col, row); }

        /// Row-major position of a cell, `row * cols + col`
        std::size_t linear_index(const Cell &cell) const;
        Cell cell_at_index(std::size_t index) const;

        /// Partition into tiles of `tile_size` cells; edge tiles are truncated
        TiledGrid tile_via(const Size &tile_size) const;
        TiledGrid tile_via(const Grid &tile) const;

        /// Partition into exactly `layout.size()` tiles
        TiledGrid tile_into(const Grid &layout) const;

        AffineGrid add_transform(const Affine &transform) const;

        bool operator==(const Grid &other) const { return cols_ == other.cols_ && rows_ == other.rows_; }
        bool operator!=(const Grid &other) const { return !(*this == other); }

      private:
        std::size_t cols_;
        std::size_t rows_;
    };

    namespace detail {
        /// Throws out_of_bounds_error naming the first failing axis
        void check_bounds(const Size &extent, std::size_t col, std::size_t row);

        /// Nominal tile size giving exactly `layout` tiles over `extent`. Throws configuration_error.
        Size tile_size_for_layout(const Size &extent, const Size &layout);
    } // namespace detail

    std::ostream &operator<<(std::ostream &os, const Size &size);
    std::ostream &operator<<(std::ostream &os, const Cell &cell);

} // namespace griffine
