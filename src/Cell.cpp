#include "matdim/core/Cell.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "matdim/core/Errors.hpp"

namespace matdim {

namespace {

constexpr double kMinVectorLength = 1e-10;

Vec3 unit(const Vec3& v) {
  return scale(v, 1.0 / norm(v));
}

double det3(const std::array<Vec3,3>& m) {
  return dot(m[0], cross(m[1], m[2]));
}

std::string describe(const std::vector<Vec3>& lattice) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t d = 0; d < lattice.size(); ++d) {
    if (d) oss << ", ";
    oss << "(" << lattice[d][0] << " " << lattice[d][1] << " " << lattice[d][2] << ")";
  }
  oss << "]";
  return oss.str();
}

} // namespace

Cell::Cell() {
  h_ = {Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}, Vec3{0.0, 0.0, 1.0}};
  inv_ = h_;
  volume_ = 1.0;
}

Cell::Cell(const std::vector<Vec3>& lattice, const std::vector<bool>& periodic, double volume_tolerance) {
  if (lattice.size() > 3 || periodic.size() != lattice.size()) {
    throw std::runtime_error("Cell: need one periodic flag per lattice vector (at most 3)");
  }
  n_declared_ = lattice.size();
  for (std::size_t d = 0; d < n_declared_; ++d) {
    if (!is_finite(lattice[d]) || norm(lattice[d]) < kMinVectorLength) {
      throw DegenerateCellError("Cell: lattice vector " + std::to_string(d) + " has zero length in " +
                                    describe(lattice), 0.0);
    }
    h_[d] = lattice[d];
    pbc_[d] = periodic[d];
  }
  complete_basis_(volume_tolerance);

  const double det = det3(h_);
  const double rel = std::abs(det) / (norm(h_[0]) * norm(h_[1]) * norm(h_[2]));
  if (!(rel >= volume_tolerance)) {
    std::ostringstream oss;
    oss << "Cell: near-singular lattice " << describe(lattice) << " (relative volume " << rel
        << " < tolerance " << volume_tolerance << ")";
    throw DegenerateCellError(oss.str(), rel);
  }
  volume_ = std::abs(det);
  invert_();
}

void Cell::complete_basis_(double volume_tolerance) {
  if (n_declared_ == 0) {
    h_ = {Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}, Vec3{0.0, 0.0, 1.0}};
    return;
  }
  if (n_declared_ == 1) {
    // Pick the Cartesian axis least aligned with a_0 to seed the complement.
    const Vec3 a = unit(h_[0]);
    std::size_t k = 0;
    for (std::size_t c = 1; c < 3; ++c) {
      if (std::abs(a[c]) < std::abs(a[k])) k = c;
    }
    Vec3 e{0.0, 0.0, 0.0};
    e[k] = 1.0;
    h_[1] = unit(cross(a, e));
    h_[2] = unit(cross(a, h_[1]));
    return;
  }
  if (n_declared_ == 2) {
    const Vec3 n = cross(h_[0], h_[1]);
    const double rel = norm(n) / (norm(h_[0]) * norm(h_[1]));
    if (!(rel >= volume_tolerance)) {
      std::ostringstream oss;
      oss << "Cell: lattice vectors 0 and 1 are collinear (relative area " << rel << ")";
      throw DegenerateCellError(oss.str(), rel);
    }
    h_[2] = unit(n);
  }
}

void Cell::invert_() {
  // Columns of M are the lattice vectors; inv_ = M^{-1} via the adjugate.
  const Vec3& a = h_[0];
  const Vec3& b = h_[1];
  const Vec3& c = h_[2];
  const double det = det3(h_);
  const Vec3 bc = cross(b, c);
  const Vec3 ca = cross(c, a);
  const Vec3 ab = cross(a, b);
  inv_[0] = scale(bc, 1.0 / det);
  inv_[1] = scale(ca, 1.0 / det);
  inv_[2] = scale(ab, 1.0 / det);
}

std::size_t Cell::n_periodic() const {
  return static_cast<std::size_t>(pbc_[0]) + static_cast<std::size_t>(pbc_[1]) +
         static_cast<std::size_t>(pbc_[2]);
}

std::vector<std::size_t> Cell::periodic_directions() const {
  std::vector<std::size_t> out;
  for (std::size_t d = 0; d < 3; ++d) {
    if (pbc_[d]) out.push_back(d);
  }
  return out;
}

Vec3 Cell::to_fractional(const Vec3& r) const {
  return {dot(inv_[0], r), dot(inv_[1], r), dot(inv_[2], r)};
}

Vec3 Cell::to_cartesian(const Vec3& f) const {
  return add(add(scale(h_[0], f[0]), scale(h_[1], f[1])), scale(h_[2], f[2]));
}

Vec3 Cell::translation(const Image& n) const {
  return add(add(scale(h_[0], static_cast<double>(n[0])), scale(h_[1], static_cast<double>(n[1]))),
             scale(h_[2], static_cast<double>(n[2])));
}

Vec3 Cell::wrap(const Vec3& r) const {
  if (n_periodic() == 0) return r;
  Vec3 f = to_fractional(r);
  for (std::size_t d = 0; d < 3; ++d) {
    if (!pbc_[d]) continue;
    f[d] -= std::floor(f[d]);
    if (std::abs(f[d] - 1.0) < kWrapPrecision || std::abs(f[d]) < kWrapPrecision) f[d] = 0.0;
  }
  return to_cartesian(f);
}

MinImage Cell::min_image(const Vec3& from, const Vec3& to) const {
  const Vec3 diff = sub(to, from);
  MinImage best;
  best.displacement = diff;
  best.distance = norm(diff);
  if (n_periodic() == 0) return best;

  // Reduce to the central image in fractional space, then search the
  // neighbouring 3^p translations; rounding alone is not enough for skewed cells.
  const Vec3 f = to_fractional(diff);
  Image shift{0, 0, 0};
  for (std::size_t d = 0; d < 3; ++d) {
    if (pbc_[d]) shift[d] = -static_cast<int>(std::nearbyint(f[d]));
  }

  double best_sq = std::numeric_limits<double>::infinity();
  const int lo[3] = {pbc_[0] ? -1 : 0, pbc_[1] ? -1 : 0, pbc_[2] ? -1 : 0};
  const int hi[3] = {pbc_[0] ? 1 : 0, pbc_[1] ? 1 : 0, pbc_[2] ? 1 : 0};
  for (int i = lo[0]; i <= hi[0]; ++i) {
    for (int j = lo[1]; j <= hi[1]; ++j) {
      for (int k = lo[2]; k <= hi[2]; ++k) {
        const Image n{shift[0] + i, shift[1] + j, shift[2] + k};
        const Vec3 disp = add(diff, translation(n));
        const double d2 = norm_sq(disp);
        if (d2 < best_sq) {
          best_sq = d2;
          best.displacement = disp;
          best.image = n;
        }
      }
    }
  }
  best.distance = std::sqrt(best_sq);
  return best;
}

} // namespace matdim
