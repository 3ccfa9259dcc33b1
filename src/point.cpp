#include "griffine/point.hpp"

#include <ostream>

namespace griffine {

    std::ostream &operator<<(std::ostream &os, const Point &p) { return os << "Point(" << p.x() << ", " << p.y() << ")"; }

} // namespace griffine
