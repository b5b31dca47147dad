#pragma once

#include <vector>

#include "matdim/core/Cell.hpp"
#include "matdim/core/Vec3.hpp"

namespace matdim::geom {

inline MinImage minimum_image_distance(const Vec3& a, const Vec3& b, const Cell& cell) {
  return cell.min_image(a, b);
}

struct Extent {
  double min = 0.0;
  double max = 0.0;
  double length() const { return max - min; }
  bool contains(double s) const { return s >= min && s <= max; }
};

// Range of projections r . direction (direction need not be normalized; the
// result is in units of |direction| * length). Empty input gives {0,0}.
Extent extent_along(const std::vector<Vec3>& positions, const Vec3& direction);

} // namespace matdim::geom
