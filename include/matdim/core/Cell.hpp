#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "matdim/core/Structure.hpp"
#include "matdim/core/Vec3.hpp"

namespace matdim {

struct MinImage {
  double distance = 0.0;
  Vec3 displacement{0.0, 0.0, 0.0}; // to + T(image) - from
  Image image{0, 0, 0};
};

// Lattice of a structure, completed to a full 3x3 basis.
//
// Rows of H are the lattice vectors a_0, a_1, a_2. Declared vectors keep
// their index; missing ones are filled with unit vectors orthogonal to the
// declared set and are never periodic. Fractional coordinates f satisfy
// r = sum_d f_d a_d for every axis, periodic or not.
class Cell {
public:
  static constexpr double kDefaultVolumeTolerance = 1e-6;
  static constexpr double kWrapPrecision = 1e-8;

  // Fully non-periodic identity cell.
  Cell();

  // Throws DegenerateCellError on a zero-length vector or if
  // |det H| / prod(|a_d|) < volume_tolerance.
  Cell(const std::vector<Vec3>& lattice,
       const std::vector<bool>& periodic,
       double volume_tolerance = kDefaultVolumeTolerance);

  static Cell from_structure(const Structure& s, double volume_tolerance = kDefaultVolumeTolerance) {
    return Cell(s.lattice, s.periodic, volume_tolerance);
  }

  std::size_t n_declared() const { return n_declared_; }
  bool periodic(std::size_t d) const { return d < 3 && pbc_[d]; }
  const std::array<bool,3>& pbc() const { return pbc_; }
  std::size_t n_periodic() const;
  std::vector<std::size_t> periodic_directions() const;

  const Vec3& vector(std::size_t d) const { return h_[d]; }
  const std::array<Vec3,3>& matrix() const { return h_; }
  double volume() const { return volume_; }

  Vec3 to_fractional(const Vec3& r) const;
  Vec3 to_cartesian(const Vec3& f) const;
  Vec3 translation(const Image& n) const;

  // Wrap along periodic axes into [0,1). Components within kWrapPrecision
  // of 1 are mapped to 0 so that equivalent inputs wrap identically.
  Vec3 wrap(const Vec3& r) const;

  // Minimum-image displacement from `from` to `to`. Non-periodic axes use
  // the raw difference.
  MinImage min_image(const Vec3& from, const Vec3& to) const;

private:
  std::array<Vec3,3> h_{};
  std::array<Vec3,3> inv_{}; // f = inv_ * r (row-major 3x3)
  std::array<bool,3> pbc_{false, false, false};
  std::size_t n_declared_ = 0;
  double volume_ = 1.0;

  void complete_basis_(double volume_tolerance);
  void invert_();
};

} // namespace matdim
