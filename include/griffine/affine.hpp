#pragma once

#include <array>
#include <iosfwd>
#include <utility>

#include "griffine/point.hpp"

namespace griffine {

    /// Six-coefficient affine map from grid space (col, row) to model space (x, y):
    ///
    ///     x = a * col + b * row + c
    ///     y = d * col + e * row + f
    ///
    /// The coefficient order follows the `affine` convention, not GDAL's; use
    /// from_gdal() / to_gdal() to convert a GDAL geotransform.
    class Affine {
      public:
        Affine(double a, double b, double c, double d, double e, double f)
            : a_(a), b_(b), c_(c), d_(d), e_(e), f_(f) {}

        static Affine identity() { return Affine(1.0, 0.0, 0.0, 0.0, 1.0, 0.0); }
        static Affine translation(double x, double y) { return Affine(1.0, 0.0, x, 0.0, 1.0, y); }
        static Affine scale(double sx, double sy) { return Affine(sx, 0.0, 0.0, 0.0, sy, 0.0); }

        /// GDAL order: (c, a, b, f, d, e)
        static Affine from_gdal(const std::array<double, 6> &gt) {
            return Affine(gt[1], gt[2], gt[0], gt[4], gt[5], gt[3]);
        }

        /// Adopt any transform type that exposes the coefficients as members a..f
        template <typename T> static Affine from(const T &t) { return Affine(t.a, t.b, t.c, t.d, t.e, t.f); }

        double a() const { return a_; }
        double b() const { return b_; }
        double c() const { return c_; }
        double d() const { return d_; }
        double e() const { return e_; }
        double f() const { return f_; }

        std::array<double, 6> coefficients() const { return {a_, b_, c_, d_, e_, f_}; }
        std::array<double, 6> to_gdal() const { return {c_, a_, b_, f_, d_, e_}; }

        double determinant() const { return a_ * e_ - b_ * d_; }
        bool is_degenerate() const { return determinant() == 0.0; }

        /// No rotation or shear terms
        bool is_rectilinear() const { return b_ == 0.0 && d_ == 0.0; }

        Point apply(double col, double row) const { return Point{a_ * col + b_ * row + c_, d_ * col + e_ * row + f_}; }

        /// Fractional (col, row) of a model-space point. Throws degenerate_transform_error.
        std::pair<double, double> apply_inverse(const Point &p) const;

        /// Throws degenerate_transform_error
        Affine inverse() const;

        /// Same linear part, translation moved to grid offset (col, row)
        Affine shifted(double col, double row) const {
            if (col == 0.0 && row == 0.0) {
                return *this;
            }
            return Affine(a_, b_, a_ * col + b_ * row + c_, d_, e_, d_ * col + e_ * row + f_);
        }

        /// Composition: (lhs * rhs) applies rhs first
        Affine operator*(const Affine &rhs) const;

        bool operator==(const Affine &other) const { return coefficients() == other.coefficients(); }
        bool operator!=(const Affine &other) const { return !(*this == other); }

      private:
        double a_, b_, c_, d_, e_, f_;
    };

    std::ostream &operator<<(std::ostream &os, const Affine &t);

} // namespace griffine
