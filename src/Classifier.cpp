#include "matdim/app/Classifier.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "matdim/alg/neighbor/PeriodicGraphBuilder.hpp"
#include "matdim/core/Cell.hpp"
#include "matdim/symmetry/SymmetryAdapter.hpp"
#include "matdim/util/Parallel.hpp"
#include "matdim/util/Timer.hpp"

namespace matdim {

namespace {

struct Pass {
  BondGraph graph;
  region::RegionAssignment regions;
  dimensionality::DimensionalityResult dim;
};

Pass run_pass(const Structure& s, const config::ClassifierSettings& settings, int n_threads, Timings& t) {
  alg::neighbor::GraphSettings gs = settings.graph;
  gs.n_threads = n_threads;

  std::optional<BondGraph> graph;
  {
    util::ScopedTimer timer(&t.graph);
    graph.emplace(alg::neighbor::build_periodic_graph(s, gs));
  }
  region::RegionAssignment regions;
  {
    util::ScopedTimer timer(&t.regions);
    regions = region::separate_regions(*graph, s, settings.regions);
  }
  dimensionality::DimensionalityResult dim;
  {
    util::ScopedTimer timer(&t.dimensionality);
    dim = dimensionality::classify_dimensionality(*graph, regions, s);
  }
  return Pass{std::move(*graph), std::move(regions), std::move(dim)};
}

std::array<bool,3> pbc_of(const Structure& s) {
  std::array<bool,3> p{false, false, false};
  for (std::size_t d = 0; d < 3; ++d) p[d] = s.is_periodic(d);
  return p;
}

std::string pbc_string(const std::array<bool,3>& p) {
  std::string s;
  for (bool b : p) s += b ? 'T' : 'F';
  return s;
}

// Same lattice, every atom contiguously placed, periodic only along the
// propagating directions.
Structure restrict_periodicity(const Structure& s, const Pass& pass) {
  const auto placed = pass.graph.placed_positions(pass.graph.placement_images(std::vector<bool>(s.size(), true)));
  Structure out;
  out.lattice = s.lattice;
  out.periodic.assign(s.lattice.size(), false);
  for (std::size_t d = 0; d < s.lattice.size(); ++d) out.periodic[d] = pass.dim.propagates(d);
  out.atoms.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) out.add_atom(s.atoms[i].number, placed[i]);
  return out;
}

} // namespace

Classifier::Classifier(config::ClassifierSettings settings, std::shared_ptr<const symmetry::SymmetryDatabase> symmetry_db)
    : settings_(std::move(settings)), symmetry_db_(std::move(symmetry_db)) {
  settings_.validate();
}

ClassificationResult Classifier::classify(const Structure& s) const {
  return classify_(s, settings_.run.n_threads);
}

ClassificationResult Classifier::classify_(const Structure& s, int n_threads) const {
  util::Stopwatch total;
  s.validate();
  if (s.empty()) throw EmptyPrimaryRegionError("classify: structure has no atoms", 0);

  ClassificationResult::Fields f;
  const Cell declared_cell = Cell::from_structure(s, settings_.graph.volume_tolerance);
  f.declared_periodicity = pbc_of(s);

  Pass pass = run_pass(s, settings_, n_threads, f.timings);
  std::optional<Structure> effective;
  // Each override removes at least one periodic direction.
  while (pass.dim.directions != pass.graph.cell().periodic_directions()) {
    effective = restrict_periodicity(effective ? *effective : s, pass);
    pass = run_pass(*effective, settings_, n_threads, f.timings);
    ++f.passes;
  }
  f.effective_periodicity = effective ? pbc_of(*effective) : f.declared_periodicity;

  if (!pass.graph.defaulted_radius_atoms().empty()) {
    std::ostringstream msg;
    msg << pass.graph.defaulted_radius_atoms().size() << " atom(s) without a tabulated covalent radius, using "
        << settings_.graph.default_radius << " A";
    f.diagnostics.push_back({"unknown_species", msg.str(), pass.graph.defaulted_radius_atoms()});
  }
  if (effective) {
    f.diagnostics.push_back({"periodicity_override",
                             "declared periodicity " + pbc_string(f.declared_periodicity) + " replaced by measured " +
                                 pbc_string(f.effective_periodicity) + " after " + std::to_string(f.passes) + " passes",
                             {}});
  }

  {
    util::ScopedTimer timer(&f.timings.dimensionality);
    f.subtype = dimensionality::assign_subtype(pass.dim, pass.graph, pass.regions, declared_cell,
                                               settings_.dimensionality);
  }

  if (pass.dim.rank >= 1 && settings_.symmetry.enabled) {
    if (!symmetry_db_) {
      f.diagnostics.push_back({"symmetry_unavailable", "no symmetry database configured", {}});
    } else {
      util::ScopedTimer timer(&f.timings.symmetry);
      const auto sub = symmetry::make_primary_substructure(pass.graph, pass.regions, pass.dim,
                                                           settings_.symmetry.tolerance,
                                                           settings_.symmetry.vacuum_padding);
      f.symmetry = symmetry::SymmetryAdapter(symmetry_db_).analyze(sub, settings_.symmetry.timeout);
    }
  }

  f.dimensionality = std::move(pass.dim);
  f.regions = std::move(pass.regions);

  if (settings_.run.log_warnings) {
    for (const auto& d : f.diagnostics) report_(d);
  }
  f.timings.total = total.seconds();
  return ClassificationResult(std::move(f));
}

void Classifier::report_(const Diagnostic& d) const {
  std::cerr << "[MATDIM] warning: " << d.code << ": " << d.message << "\n";
}

std::vector<BatchOutcome> Classifier::classify_batch(const std::vector<Structure>& structures) const {
  std::vector<BatchOutcome> out(structures.size());
  // Parallel over structures; each structure is built single-threaded.
  util::parallel_for(structures.size(), settings_.run.n_threads, [&](std::size_t k) {
    try {
      out[k].result.emplace(classify_(structures[k], 1));
    } catch (const ClassificationError& e) {
      out[k].error_kind = e.kind();
      out[k].error_message = e.what();
    } catch (const std::exception& e) {
      out[k].error_message = e.what();
    } catch (...) {
      out[k].error_message = "unknown exception";
    }
  });
  return out;
}

} // namespace matdim
