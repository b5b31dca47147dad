#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "matdim/core/Cell.hpp"
#include "matdim/core/Structure.hpp"
#include "matdim/region/RegionSeparator.hpp"
#include "matdim/topology/BondGraph.hpp"

namespace matdim::dimensionality {

struct DimensionalityResult {
  std::size_t rank = 0;                 // 0..3
  std::vector<std::size_t> directions;  // propagating lattice directions, sorted
  std::size_t declared = 0;             // periodic directions of the structure it was measured on

  bool propagates(std::size_t d) const {
    for (auto x : directions) {
      if (x == d) return true;
    }
    return false;
  }
  bool operator==(const DimensionalityResult& o) const {
    return rank == o.rank && directions == o.directions && declared == o.declared;
  }
  bool operator!=(const DimensionalityResult& o) const { return !(*this == o); }
};

// "0D".."3D"
std::string dimension_label(std::size_t rank);

// Count the lattice directions along which the Primary network is infinite.
//
// Direction d propagates iff some Primary atom i has (i, 0) and (i, e_d) in
// the same component of the Primary-induced subgraph. Each direction is
// tested on its own: connectivity only to diagonal images (e.g. e_0 + e_1)
// does not count for either axis.
//
// Throws InconsistentPeriodicityError if a propagating direction is not
// declared periodic in `s` or the rank exceeds the declared count.
DimensionalityResult classify_dimensionality(const BondGraph& graph,
                                             const region::RegionAssignment& regions,
                                             const Structure& s);

enum class Subtype { Cluster, Chain, Surface, Material2D, Bulk, Unknown };

std::string subtype_name(Subtype t);

struct SubtypeSettings {
  double vacuum_threshold = 7.0;  // Angstrom, minimum empty gap along the layer normal
  double max_2d_thickness = 4.0;  // Angstrom, thicker vacuum-bounded layers are surfaces
};

struct SubtypeResult {
  Subtype subtype = Subtype::Unknown;
  // Rank 2 only.
  Vec3 layer_normal{0.0, 0.0, 0.0};
  double thickness = 0.0;
  double vacuum_gap = 0.0;       // +inf when the stacking direction is not periodic
  bool outlier_in_layer = false;
  bool vacuum_only = false;
};

// Rank 0 -> Cluster, 1 -> Chain, 3 -> Bulk.
//
// Rank 2: n = a_p x a_q over the propagating vectors, thickness = extent of
// the contiguously placed Primary atoms along n. The stacking direction is
// vacuum-only when the gap along n in `declared_cell` (period minus
// thickness, unbounded if the third direction is not periodic there) is at
// least vacuum_threshold and no Outlier atom falls inside the thickness
// band. Vacuum-only layers are Material2D up to max_2d_thickness and Surface
// beyond; anything else is Unknown.
SubtypeResult assign_subtype(const DimensionalityResult& dim,
                             const BondGraph& graph,
                             const region::RegionAssignment& regions,
                             const Cell& declared_cell,
                             const SubtypeSettings& settings);

} // namespace matdim::dimensionality
