#include "matdim/symmetry/SymmetryAdapter.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>

#include "matdim/core/Errors.hpp"

namespace matdim::symmetry {

namespace {

int determinant(const std::array<std::array<int,3>,3>& m) {
  return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) -
         m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
         m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

// Shared with the worker so that an abandoned call can still finish safely.
struct PendingCall {
  std::promise<SymmetryDataset> result;
  std::atomic<bool> cancelled{false};
};

} // namespace

Substructure make_primary_substructure(const BondGraph& graph,
                                       const region::RegionAssignment& regions,
                                       const dimensionality::DimensionalityResult& dim,
                                       double tolerance,
                                       double vacuum_padding) {
  const auto mask = regions.primary_mask();
  const auto placed = graph.placed_positions(graph.placement_images(mask));
  const Cell& cell = graph.cell();

  Substructure sub;
  sub.n_atoms_total = graph.atom_count();
  sub.request.tolerance = tolerance;
  for (std::size_t i = 0; i < placed.size(); ++i) {
    if (!mask[i]) continue;
    sub.original_index.push_back(i);
    sub.request.positions.push_back(placed[i]);
    sub.request.numbers.push_back(graph.numbers()[i]);
  }

  for (std::size_t d = 0; d < 3; ++d) {
    const Vec3& a = cell.vector(d);
    if (dim.propagates(d)) {
      sub.request.lattice[d] = a;
      continue;
    }
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto& r : sub.request.positions) {
      const double f = cell.to_fractional(r)[d];
      lo = std::min(lo, f);
      hi = std::max(hi, f);
    }
    const double len = norm(a);
    const double extent = sub.request.positions.empty() ? 0.0 : (hi - lo) * len;
    const double target = extent + std::max(vacuum_padding, 2.0 * extent);
    sub.request.lattice[d] = scale(a, target / len);
  }
  return sub;
}

std::string crystal_system(int n) {
  if (n < 1 || n > 230) throw std::runtime_error("crystal_system: space group out of range: " + std::to_string(n));
  if (n <= 2) return "triclinic";
  if (n <= 15) return "monoclinic";
  if (n <= 74) return "orthorhombic";
  if (n <= 142) return "tetragonal";
  if (n <= 167) return "trigonal";
  if (n <= 194) return "hexagonal";
  return "cubic";
}

std::string bravais_lattice(int space_group, const std::string& international_symbol) {
  const std::string system = crystal_system(space_group);
  char family = 'c';
  if (system == "triclinic") family = 'a';
  else if (system == "monoclinic") family = 'm';
  else if (system == "orthorhombic") family = 'o';
  else if (system == "tetragonal") family = 't';
  else if (system == "trigonal" || system == "hexagonal") family = 'h';

  if (international_symbol.empty()) throw std::runtime_error("bravais_lattice: empty international symbol");
  char centring = international_symbol[0];
  switch (centring) {
    case 'P': case 'I': case 'R': case 'F': break;
    case 'A': case 'B': case 'C': centring = 'S'; break;
    default:
      throw std::runtime_error("bravais_lattice: unknown centring in '" + international_symbol + "'");
  }
  return std::string{family, centring};
}

SymmetryAdapter::SymmetryAdapter(std::shared_ptr<const SymmetryDatabase> db) : db_(std::move(db)) {
  if (!db_) throw std::runtime_error("SymmetryAdapter: database is null");
}

SymmetryDataset SymmetryAdapter::run_(const SymmetryRequest& request, std::chrono::milliseconds timeout) const {
  if (timeout.count() <= 0) {
    const std::atomic<bool> never{false};
    return db_->find_symmetry(request, never);
  }

  auto call = std::make_shared<PendingCall>();
  auto future = call->result.get_future();
  std::thread worker([call, db = db_, request]() {
    try {
      call->result.set_value(db->find_symmetry(request, call->cancelled));
    } catch (...) {
      call->result.set_exception(std::current_exception());
    }
  });

  if (future.wait_for(timeout) == std::future_status::timeout) {
    call->cancelled = true;
    worker.detach();
    throw SymmetryTimeoutError("symmetry database '" + db_->name() + "' did not answer within " +
                                   std::to_string(timeout.count()) + " ms",
                               timeout);
  }
  worker.join();
  return future.get();
}

SymmetrySummary SymmetryAdapter::analyze(const Substructure& sub, std::chrono::milliseconds timeout) const {
  const std::size_t m = sub.original_index.size();
  if (sub.request.positions.size() != m || sub.request.numbers.size() != m) {
    throw std::runtime_error("SymmetryAdapter: substructure index map does not match the request");
  }

  SymmetryDataset ds = run_(sub.request, timeout);

  if (ds.space_group < 1 || ds.space_group > 230) {
    throw SymmetryDatabaseError("symmetry database returned space group " + std::to_string(ds.space_group),
                                sub.original_index);
  }
  if (!ds.wyckoff_letters.empty() && ds.wyckoff_letters.size() != m) {
    throw SymmetryDatabaseError("symmetry database returned " + std::to_string(ds.wyckoff_letters.size()) +
                                    " Wyckoff letters for " + std::to_string(m) + " atoms",
                                sub.original_index);
  }
  if (!ds.equivalent_atoms.empty() && ds.equivalent_atoms.size() != m) {
    throw SymmetryDatabaseError("symmetry database returned " + std::to_string(ds.equivalent_atoms.size()) +
                                    " equivalent-atom entries for " + std::to_string(m) + " atoms",
                                sub.original_index);
  }

  const std::size_t n_conv = ds.conventional_positions.size();
  if (ds.conventional_numbers.size() != n_conv ||
      (!ds.conventional_wyckoff_letters.empty() && ds.conventional_wyckoff_letters.size() != n_conv) ||
      (!ds.conventional_equivalent_atoms.empty() && ds.conventional_equivalent_atoms.size() != n_conv)) {
    throw SymmetryDatabaseError("symmetry database returned an inconsistent conventional cell of " +
                                    std::to_string(n_conv) + " atoms",
                                sub.original_index);
  }

  SymmetrySummary out;
  out.database = db_->name();
  out.space_group = ds.space_group;
  out.international_symbol = ds.international_symbol;
  out.hall_number = ds.hall_number;
  out.hall_symbol = ds.hall_symbol;
  out.choice = ds.choice;
  out.point_group = ds.point_group;
  out.crystal_system = crystal_system(ds.space_group);
  try {
    out.bravais_lattice = bravais_lattice(ds.space_group, ds.international_symbol);
  } catch (const std::runtime_error& e) {
    throw SymmetryDatabaseError(std::string("symmetry database returned an unusable symbol: ") + e.what(),
                                sub.original_index);
  }
  out.primitive_lattice = ds.primitive_lattice;
  out.n_operations = ds.rotations.size();
  if (!ds.rotations.empty()) {
    out.chiral = std::all_of(ds.rotations.begin(), ds.rotations.end(),
                             [](const auto& r) { return determinant(r) == 1; });
  }

  out.atoms = sub.original_index;
  out.wyckoff_letters.assign(sub.n_atoms_total, '-');
  out.equivalent_atoms.assign(sub.n_atoms_total, -1);
  for (std::size_t k = 0; k < m; ++k) {
    const std::size_t i = sub.original_index[k];
    if (!ds.wyckoff_letters.empty()) out.wyckoff_letters[i] = ds.wyckoff_letters[k];
    if (!ds.equivalent_atoms.empty()) {
      const int e = ds.equivalent_atoms[k];
      if (e < 0 || static_cast<std::size_t>(e) >= m) {
        throw SymmetryDatabaseError("symmetry database returned equivalent atom " + std::to_string(e) +
                                        " out of range", {i});
      }
      out.equivalent_atoms[i] = static_cast<long>(sub.original_index[static_cast<std::size_t>(e)]);
    }
  }

  out.conventional_lattice = ds.conventional_lattice;
  out.conventional_positions = ds.conventional_positions;
  out.conventional_numbers = ds.conventional_numbers;
  out.conventional_wyckoff_letters = ds.conventional_wyckoff_letters;
  out.conventional_equivalent_atoms.reserve(ds.conventional_equivalent_atoms.size());
  for (const int e : ds.conventional_equivalent_atoms) {
    if (e < 0 || static_cast<std::size_t>(e) >= m) {
      throw SymmetryDatabaseError("symmetry database returned conventional equivalent atom " + std::to_string(e) +
                                      " out of range", sub.original_index);
    }
    out.conventional_equivalent_atoms.push_back(static_cast<long>(sub.original_index[static_cast<std::size_t>(e)]));
  }
  out.transformation_matrix = ds.transformation_matrix;
  out.origin_shift = ds.origin_shift;
  out.has_free_wyckoff_parameters = ds.has_free_wyckoff_parameters;
  return out;
}

} // namespace matdim::symmetry
