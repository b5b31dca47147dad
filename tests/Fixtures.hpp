#pragma once

#include <cmath>
#include <utility>
#include <vector>

#include "matdim/core/Structure.hpp"

namespace matdim::fixtures {

inline Structure cubic(double a, std::vector<bool> pbc = {true, true, true}) {
  Structure s;
  s.lattice = {Vec3{a, 0.0, 0.0}, Vec3{0.0, a, 0.0}, Vec3{0.0, 0.0, a}};
  s.periodic = std::move(pbc);
  return s;
}

// Simple cubic carbon, n^3 atoms, nearest neighbours at `spacing`.
inline Structure simple_cubic_carbon(double spacing, int n = 1) {
  Structure s = cubic(spacing * n);
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      for (int k = 0; k < n; ++k) s.add_atom(6, {i * spacing, j * spacing, k * spacing});
    }
  }
  return s;
}

// Two-atom graphene cell, sheet at z = 10 in a 20 A box.
inline Structure graphene(std::vector<bool> pbc = {true, true, true}) {
  const double a = 2.4595121467478055;
  const std::vector<Vec3> lattice = {Vec3{a, 0.0, 0.0}, Vec3{-0.5 * a, 0.5 * std::sqrt(3.0) * a, 0.0},
                                     Vec3{0.0, 0.0, 20.0}};
  return Structure::from_fractional(lattice, pbc, {6, 6},
                                    {Vec3{1.0 / 3.0, 2.0 / 3.0, 0.5}, Vec3{2.0 / 3.0, 1.0 / 3.0, 0.5}});
}

// Square carbon net stacked into `layers` layers, 1.5 A apart in every
// direction, first layer at z0, in a cell of height `height`. In-plane
// repeat is nxy x nxy atoms.
inline Structure carbon_slab(int layers, double z0 = 5.0, double height = 15.0, int nxy = 1) {
  const double d = 1.5;
  Structure s;
  s.lattice = {Vec3{d * nxy, 0.0, 0.0}, Vec3{0.0, d * nxy, 0.0}, Vec3{0.0, 0.0, height}};
  s.periodic = {true, true, true};
  for (int l = 0; l < layers; ++l) {
    for (int i = 0; i < nxy; ++i) {
      for (int j = 0; j < nxy; ++j) {
        double z = z0 + l * d;
        z -= height * std::floor(z / height);
        s.add_atom(6, {i * d, j * d, z});
      }
    }
  }
  return s;
}

// Carbon chain along x, 1.5 A spacing, in a 10 x 10 box.
inline Structure carbon_chain(std::vector<bool> pbc = {true, true, true}) {
  Structure s;
  s.lattice = {Vec3{1.5, 0.0, 0.0}, Vec3{0.0, 10.0, 0.0}, Vec3{0.0, 0.0, 10.0}};
  s.periodic = std::move(pbc);
  s.add_atom(6, {0.0, 5.0, 5.0});
  return s;
}

inline Structure hydrogen_molecule() {
  Structure s;
  s.add_atom(1, {0.0, 0.0, 0.0});
  s.add_atom(1, {0.74, 0.0, 0.0});
  return s;
}

} // namespace matdim::fixtures
