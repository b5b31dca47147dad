#include "matdim/geom/Geometry.hpp"

#include <algorithm>
#include <limits>

namespace matdim::geom {

Extent extent_along(const std::vector<Vec3>& positions, const Vec3& direction) {
  if (positions.empty()) return {};
  Extent e;
  e.min = std::numeric_limits<double>::infinity();
  e.max = -std::numeric_limits<double>::infinity();
  for (const auto& r : positions) {
    const double s = dot(r, direction);
    e.min = std::min(e.min, s);
    e.max = std::max(e.max, s);
  }
  return e;
}

} // namespace matdim::geom
