#pragma once

#include "matdim/core/Cell.hpp"
#include "matdim/core/Structure.hpp"
#include "matdim/topology/BondGraph.hpp"

namespace matdim::alg::neighbor {

struct GraphSettings {
  double radius_factor = 1.1;     // scales rA + rB
  double bond_tolerance = 0.1;    // Angstrom, added after scaling
  int max_translation_shell = 1;  // images in [-shell, shell] per periodic axis
  double default_radius = 1.5;    // Angstrom, for species without a tabulated radius
  double volume_tolerance = Cell::kDefaultVolumeTolerance;
  int n_threads = 0;              // <= 0: OpenMP default

  double bond_threshold(double ra, double rb) const { return radius_factor * (ra + rb) + bond_tolerance; }
};

// Build the bond graph of `s` over the original cell plus a shell of
// periodic images.
//
// Positions are wrapped into the cell along periodic axes first. For every
// atom pair i <= j and every relative translation t in [-2*shell, 2*shell]
// on periodic axes, |r_j + T(t) - r_i| is compared against
// settings.bond_threshold(r_i, r_j); each bond is then expanded to all node
// pairs inside the shell. An atom bonding to its own image (i == j, t != 0)
// is a valid edge.
//
// Naive O(N^2 * (4*shell+1)^p). The pair loop runs per atom in parallel and
// is merged in atom order, so the graph does not depend on thread count.
//
// Throws DegenerateCellError for a near-singular lattice.
BondGraph build_periodic_graph(const Structure& s, const GraphSettings& settings);

} // namespace matdim::alg::neighbor
