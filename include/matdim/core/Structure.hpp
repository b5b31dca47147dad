#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "matdim/core/Vec3.hpp"

namespace matdim {

struct Atom {
  int number = 0;                   // atomic number (species identifier)
  Vec3 position{0.0, 0.0, 0.0};     // Cartesian, Angstrom
  std::optional<Vec3> fractional;   // informational; never required
};

// Input to a classification call. The analysis core never mutates it.
//
// `lattice` holds 0..3 lattice vectors; `periodic` holds one flag per
// declared vector. Directions without a declared vector are non-periodic.
struct Structure {
  std::vector<Atom> atoms;
  std::vector<Vec3> lattice;
  std::vector<bool> periodic;

  std::size_t size() const { return atoms.size(); }
  bool empty() const { return atoms.empty(); }

  std::size_t n_periodic() const {
    std::size_t n = 0;
    for (bool p : periodic) n += p ? 1u : 0u;
    return n;
  }

  bool is_periodic(std::size_t d) const { return d < periodic.size() && periodic[d]; }

  void add_atom(int number, const Vec3& position) {
    Atom a;
    a.number = number;
    a.position = position;
    atoms.push_back(a);
  }

  std::vector<Vec3> positions() const {
    std::vector<Vec3> out;
    out.reserve(atoms.size());
    for (const auto& a : atoms) out.push_back(a.position);
    return out;
  }

  std::vector<int> numbers() const {
    std::vector<int> out;
    out.reserve(atoms.size());
    for (const auto& a : atoms) out.push_back(a.number);
    return out;
  }

  void validate() const {
    if (lattice.size() > 3) {
      throw std::runtime_error("Structure: at most 3 lattice vectors are allowed, got " +
                               std::to_string(lattice.size()));
    }
    if (periodic.size() != lattice.size()) {
      throw std::runtime_error("Structure: " + std::to_string(periodic.size()) + " periodic flags for " +
                               std::to_string(lattice.size()) + " lattice vectors");
    }
    for (std::size_t d = 0; d < lattice.size(); ++d) {
      if (!is_finite(lattice[d])) {
        throw std::runtime_error("Structure: lattice vector " + std::to_string(d) + " is not finite");
      }
    }
    for (std::size_t i = 0; i < atoms.size(); ++i) {
      if (!is_finite(atoms[i].position)) {
        throw std::runtime_error("Structure: position of atom " + std::to_string(i) + " is not finite");
      }
      if (atoms[i].fractional && !is_finite(*atoms[i].fractional)) {
        throw std::runtime_error("Structure: fractional position of atom " + std::to_string(i) + " is not finite");
      }
    }
  }

  // Build a structure from fractional coordinates over a full 3-vector lattice.
  static Structure from_fractional(const std::vector<Vec3>& lattice_vectors,
                                   const std::vector<bool>& pbc,
                                   const std::vector<int>& numbers,
                                   const std::vector<Vec3>& fractional) {
    if (numbers.size() != fractional.size()) {
      throw std::runtime_error("Structure::from_fractional: numbers/fractional size mismatch");
    }
    Structure s;
    s.lattice = lattice_vectors;
    s.periodic = pbc;
    s.atoms.reserve(numbers.size());
    for (std::size_t i = 0; i < numbers.size(); ++i) {
      Vec3 r{0.0, 0.0, 0.0};
      for (std::size_t d = 0; d < lattice_vectors.size() && d < 3; ++d) {
        r = add(r, scale(lattice_vectors[d], fractional[i][d]));
      }
      Atom a;
      a.number = numbers[i];
      a.position = r;
      a.fractional = fractional[i];
      s.atoms.push_back(a);
    }
    return s;
  }
};

} // namespace matdim
