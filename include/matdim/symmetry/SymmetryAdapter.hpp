#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "matdim/dimensionality/DimensionalityClassifier.hpp"
#include "matdim/region/RegionSeparator.hpp"
#include "matdim/symmetry/SymmetryDatabase.hpp"
#include "matdim/topology/BondGraph.hpp"

namespace matdim::symmetry {

// Symmetry of the Primary region, indexed by original atom.
struct SymmetrySummary {
  std::string database;
  int space_group = 1;
  std::string international_symbol;
  int hall_number = 0;
  std::string hall_symbol;
  std::string choice;
  std::string point_group;
  std::string crystal_system;
  std::string bravais_lattice;   // Pearson notation, e.g. "cF"
  std::optional<bool> chiral;    // unset when the database reports no operations
  std::size_t n_operations = 0;
  std::array<Vec3,3> primitive_lattice{};

  std::vector<std::size_t> atoms;      // original indices that were analysed, ascending
  std::vector<char> wyckoff_letters;   // per original atom; '-' if not analysed
  std::vector<long> equivalent_atoms;  // per original atom, original indices; -1 if not analysed

  std::array<Vec3,3> conventional_lattice{};
  std::vector<Vec3> conventional_positions;
  std::vector<int> conventional_numbers;
  std::vector<char> conventional_wyckoff_letters;
  std::vector<long> conventional_equivalent_atoms;  // original indices
  std::array<Vec3,3> transformation_matrix{};
  Vec3 origin_shift{};
  std::optional<bool> has_free_wyckoff_parameters;
};

// A Primary-only request plus the map back to original atom indices.
struct Substructure {
  SymmetryRequest request;
  std::vector<std::size_t> original_index; // request atom k -> original atom
  std::size_t n_atoms_total = 0;
};

// Primary atoms, contiguously placed, over the three cell vectors. Every
// non-propagating direction d gets a vector along a_d of length
// extent_d + max(vacuum_padding, 2 * extent_d), extent_d being the span of
// the Primary atoms along a_d, so that no translation appears along it.
Substructure make_primary_substructure(const BondGraph& graph,
                                       const region::RegionAssignment& regions,
                                       const dimensionality::DimensionalityResult& dim,
                                       double tolerance,
                                       double vacuum_padding);

// "triclinic" .. "cubic" for space groups 1..230.
std::string crystal_system(int space_group);

// Pearson symbol of the Bravais lattice: crystal family letter (a, m, o, t,
// h, c; trigonal groups count as hexagonal) followed by the centring letter
// of the international symbol, with A, B and C folded into S.
std::string bravais_lattice(int space_group, const std::string& international_symbol);

class SymmetryAdapter {
public:
  explicit SymmetryAdapter(std::shared_ptr<const SymmetryDatabase> db);

  const SymmetryDatabase& database() const { return *db_; }

  // Runs the database on a worker thread. If no answer arrives within
  // `timeout` the call is flagged cancelled, abandoned and
  // SymmetryTimeoutError is thrown. A non-positive timeout runs inline.
  // Identity symmetry (space group 1) is a normal result.
  SymmetrySummary analyze(const Substructure& sub, std::chrono::milliseconds timeout) const;

private:
  std::shared_ptr<const SymmetryDatabase> db_;

  SymmetryDataset run_(const SymmetryRequest& request, std::chrono::milliseconds timeout) const;
};

} // namespace matdim::symmetry
