#include "griffine/affine.hpp"

#include <ostream>

#include "griffine/errors.hpp"

namespace griffine {

    std::pair<double, double> Affine::apply_inverse(const Point &p) const {
        const double det = determinant();
        if (det == 0.0) {
            throw degenerate_transform_error(det);
        }

        const double dx = p.x() - c_;
        const double dy = p.y() - f_;

        if (is_rectilinear()) {
            return {dx / a_, dy / e_};
        }
        return {(e_ * dx - b_ * dy) / det, (a_ * dy - d_ * dx) / det};
    }

    Affine Affine::inverse() const {
        const double det = determinant();
        if (det == 0.0) {
            throw degenerate_transform_error(det);
        }

        const double ia = e_ / det;
        const double ib = -b_ / det;
        const double id = -d_ / det;
        const double ie = a_ / det;
        return Affine(ia, ib, -(ia * c_ + ib * f_), id, ie, -(id * c_ + ie * f_));
    }

    Affine Affine::operator*(const Affine &rhs) const {
        return Affine(a_ * rhs.a_ + b_ * rhs.d_, a_ * rhs.b_ + b_ * rhs.e_, a_ * rhs.c_ + b_ * rhs.f_ + c_,
                      d_ * rhs.a_ + e_ * rhs.d_, d_ * rhs.b_ + e_ * rhs.e_, d_ * rhs.c_ + e_ * rhs.f_ + f_);
    }

    std::ostream &operator<<(std::ostream &os, const Affine &t) {
        return os << "Affine(" << t.a() << ", " << t.b() << ", " << t.c() << ", " << t.d() << ", " << t.e() << ", "
                  << t.f() << ")";
    }

} // namespace griffine
