#include "matdim/alg/neighbor/PeriodicGraphBuilder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "matdim/chem/Elements.hpp"
#include "matdim/util/Parallel.hpp"

namespace matdim::alg::neighbor {

namespace {

// Relative translations in [-reach, reach] on periodic axes.
std::vector<Image> relative_translations(const Cell& cell, int reach) {
  std::vector<Image> out;
  const int lo[3] = {cell.periodic(0) ? -reach : 0, cell.periodic(1) ? -reach : 0, cell.periodic(2) ? -reach : 0};
  const int hi[3] = {cell.periodic(0) ? reach : 0, cell.periodic(1) ? reach : 0, cell.periodic(2) ? reach : 0};
  for (int i = lo[0]; i <= hi[0]; ++i) {
    for (int j = lo[1]; j <= hi[1]; ++j) {
      for (int k = lo[2]; k <= hi[2]; ++k) {
        out.push_back(Image{i, j, k});
      }
    }
  }
  return out;
}

bool lexicographically_positive(const Image& t) {
  for (std::size_t d = 0; d < 3; ++d) {
    if (t[d] > 0) return true;
    if (t[d] < 0) return false;
  }
  return false;
}

} // namespace

BondGraph build_periodic_graph(const Structure& s, const GraphSettings& settings) {
  if (settings.max_translation_shell < 1) {
    throw std::runtime_error("build_periodic_graph: max_translation_shell must be >= 1");
  }
  if (!(settings.radius_factor > 0.0)) {
    throw std::runtime_error("build_periodic_graph: radius_factor must be positive");
  }

  Cell cell = Cell::from_structure(s, settings.volume_tolerance);
  const std::size_t n = s.size();

  std::vector<Vec3> wrapped(n);
  std::vector<double> radius(n);
  std::vector<std::size_t> defaulted;
  const chem::RadiusTable radii(settings.default_radius);
  for (std::size_t i = 0; i < n; ++i) {
    wrapped[i] = cell.wrap(s.atoms[i].position);
    const auto r = radii.lookup(s.atoms[i].number);
    radius[i] = r.radius;
    if (!r.known) defaulted.push_back(i);
  }

  const std::vector<Image> translations = relative_translations(cell, 2 * settings.max_translation_shell);
  std::vector<Vec3> shifts(translations.size());
  for (std::size_t t = 0; t < translations.size(); ++t) shifts[t] = cell.translation(translations[t]);

  std::vector<std::vector<BondRecord>> per_atom(n);
  util::parallel_for(n, settings.n_threads, [&](std::size_t i) {
    auto& out = per_atom[i];
    for (std::size_t j = i; j < n; ++j) {
      const double cutoff = settings.bond_threshold(radius[i], radius[j]);
      const double cutoff_sq = cutoff * cutoff;
      const Vec3 rij = sub(wrapped[j], wrapped[i]);
      for (std::size_t t = 0; t < translations.size(); ++t) {
        if (i == j && !lexicographically_positive(translations[t])) continue;
        const double d2 = norm_sq(add(rij, shifts[t]));
        if (d2 <= cutoff_sq) {
          BondRecord b;
          b.i = i;
          b.j = j;
          b.translation = translations[t];
          b.distance = std::sqrt(d2);
          out.push_back(b);
        }
      }
    }
  });

  BondGraph g(cell, std::move(wrapped), s.numbers(), settings.max_translation_shell);
  g.set_defaulted_radius_atoms(std::move(defaulted));
  for (const auto& bonds : per_atom) {
    for (const auto& b : bonds) g.add_bond(b);
  }
  g.finalize();
  return g;
}

} // namespace matdim::alg::neighbor
