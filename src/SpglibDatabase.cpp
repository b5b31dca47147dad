#include "matdim/symmetry/SpglibDatabase.hpp"

#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include <spglib.h>

#include "matdim/core/Cell.hpp"
#include "matdim/core/Errors.hpp"

namespace matdim::symmetry {

namespace {

struct DatasetDeleter {
  void operator()(SpglibDataset* ds) const { spg_free_dataset(ds); }
};
using DatasetPtr = std::unique_ptr<SpglibDataset, DatasetDeleter>;

std::string trimmed(const char* s) {
  std::string out(s);
  while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.pop_back();
  std::size_t b = 0;
  while (b < out.size() && std::isspace(static_cast<unsigned char>(out[b]))) ++b;
  return out.substr(b);
}

} // namespace

std::string SpglibDatabase::name() const {
  return "spglib " + std::to_string(spg_get_major_version()) + "." + std::to_string(spg_get_minor_version()) + "." +
         std::to_string(spg_get_micro_version());
}

SymmetryDataset SpglibDatabase::find_symmetry(const SymmetryRequest& request, const std::atomic<bool>& cancelled) const {
  (void)cancelled;
  const std::size_t n = request.positions.size();
  if (n == 0) throw SymmetryDatabaseError("spglib: no atoms in request");
  if (request.numbers.size() != n) throw SymmetryDatabaseError("spglib: positions/numbers size mismatch");

  const Cell cell({request.lattice[0], request.lattice[1], request.lattice[2]}, {true, true, true});

  // spglib takes lattice vectors as columns.
  double lattice[3][3];
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) lattice[r][c] = request.lattice[c][r];
  }
  std::vector<double> frac(3 * n);
  for (std::size_t i = 0; i < n; ++i) {
    const Vec3 f = cell.to_fractional(request.positions[i]);
    for (std::size_t d = 0; d < 3; ++d) frac[3 * i + d] = f[d];
  }
  std::vector<int> types(request.numbers.begin(), request.numbers.end());

  DatasetPtr ds(spg_get_dataset(lattice, reinterpret_cast<const double(*)[3]>(frac.data()), types.data(),
                                static_cast<int>(n), request.tolerance));
  if (!ds) {
    const SpglibError code = spg_get_error_code();
    throw SymmetryDatabaseError(std::string("spglib: ") + spg_get_error_message(code));
  }

  SymmetryDataset out;
  out.space_group = ds->spacegroup_number;
  out.international_symbol = trimmed(ds->international_symbol);
  out.hall_number = ds->hall_number;
  out.hall_symbol = trimmed(ds->hall_symbol);
  out.choice = trimmed(ds->choice);
  out.point_group = trimmed(ds->pointgroup_symbol);

  out.wyckoff_letters.resize(n);
  out.equivalent_atoms.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.wyckoff_letters[i] = static_cast<char>('a' + ds->wyckoffs[i]);
    out.equivalent_atoms[i] = ds->equivalent_atoms[i];
  }
  for (std::size_t r = 0; r < 3; ++r) {
    for (std::size_t c = 0; c < 3; ++c) {
      out.primitive_lattice[c][r] = ds->primitive_lattice[r][c];
      out.conventional_lattice[c][r] = ds->std_lattice[r][c];
      out.transformation_matrix[r][c] = ds->transformation_matrix[r][c];
    }
    out.origin_shift[r] = ds->origin_shift[r];
  }

  // Conventional sites inherit the labels of the first input atom that maps
  // onto the same primitive atom.
  std::vector<int> first_of_primitive(n, -1);
  for (std::size_t i = 0; i < n; ++i) {
    const int p = ds->mapping_to_primitive[i];
    if (p >= 0 && static_cast<std::size_t>(p) < n && first_of_primitive[static_cast<std::size_t>(p)] < 0) {
      first_of_primitive[static_cast<std::size_t>(p)] = static_cast<int>(i);
    }
  }
  const std::size_t n_std = static_cast<std::size_t>(ds->n_std_atoms);
  out.conventional_positions.reserve(n_std);
  out.conventional_numbers.reserve(n_std);
  out.conventional_wyckoff_letters.reserve(n_std);
  out.conventional_equivalent_atoms.reserve(n_std);
  for (std::size_t k = 0; k < n_std; ++k) {
    Vec3 r{0, 0, 0};
    for (std::size_t c = 0; c < 3; ++c) r = add(r, scale(out.conventional_lattice[c], ds->std_positions[k][c]));
    out.conventional_positions.push_back(r);
    out.conventional_numbers.push_back(ds->std_types[k]);

    const int p = ds->std_mapping_to_primitive[k];
    const int i = (p >= 0 && static_cast<std::size_t>(p) < n) ? first_of_primitive[static_cast<std::size_t>(p)] : -1;
    if (i < 0) throw SymmetryDatabaseError("spglib: conventional atom " + std::to_string(k) + " has no input atom");
    out.conventional_wyckoff_letters.push_back(static_cast<char>('a' + ds->wyckoffs[i]));
    out.conventional_equivalent_atoms.push_back(ds->equivalent_atoms[i]);
  }

  out.rotations.resize(static_cast<std::size_t>(ds->n_operations));
  for (int k = 0; k < ds->n_operations; ++k) {
    for (int r = 0; r < 3; ++r) {
      for (int c = 0; c < 3; ++c) out.rotations[static_cast<std::size_t>(k)][r][c] = ds->rotations[k][r][c];
    }
  }
  return out;
}

} // namespace matdim::symmetry
