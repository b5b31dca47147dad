#pragma once

#include <array>
#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "matdim/core/Vec3.hpp"

namespace matdim::symmetry {

// Input of one symmetry search, in the database's contiguous index space
// (atom k of the request is the k-th entry of positions/numbers).
struct SymmetryRequest {
  std::array<Vec3,3> lattice{}; // rows a_0, a_1, a_2
  std::vector<Vec3> positions;  // Cartesian, Angstrom
  std::vector<int> numbers;
  double tolerance = 0.1;       // Angstrom
};

struct SymmetryDataset {
  int space_group = 1;
  std::string international_symbol = "P1";
  int hall_number = 0;                 // 1..530, 0 if not reported
  std::string hall_symbol;
  std::string choice;                  // setting choice, empty for the default setting
  std::string point_group;
  std::vector<char> wyckoff_letters;   // per request atom
  std::vector<int> equivalent_atoms;   // per request atom, request indices
  std::array<Vec3,3> primitive_lattice{};
  std::vector<std::array<std::array<int,3>,3>> rotations;

  // Standardized conventional cell. Empty positions mean none was reported.
  std::array<Vec3,3> conventional_lattice{};  // rows
  std::vector<Vec3> conventional_positions;   // Cartesian, Angstrom
  std::vector<int> conventional_numbers;
  std::vector<char> conventional_wyckoff_letters;  // per conventional atom
  std::vector<int> conventional_equivalent_atoms;  // per conventional atom, request indices
  std::array<Vec3,3> transformation_matrix{};      // input cell -> conventional cell
  Vec3 origin_shift{};

  // Needs a table of Wyckoff positions with their free coordinates; unset
  // when the database has none.
  std::optional<bool> has_free_wyckoff_parameters;
};

// External symmetry finder.
//
// Implementations are called from a worker thread. `cancelled` becomes true
// once the caller has given up waiting; a long-running implementation may
// poll it and return early, its result is discarded either way. Failures
// are reported with SymmetryDatabaseError.
class SymmetryDatabase {
public:
  virtual ~SymmetryDatabase() = default;

  virtual std::string name() const = 0;
  virtual SymmetryDataset find_symmetry(const SymmetryRequest& request, const std::atomic<bool>& cancelled) const = 0;
};

} // namespace matdim::symmetry
