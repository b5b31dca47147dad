#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "matdim/core/Structure.hpp"
#include "matdim/topology/BondGraph.hpp"

namespace matdim::region {

enum class Region { Primary, Outlier };

inline std::string region_name(Region r) { return r == Region::Primary ? "primary" : "outlier"; }

struct RegionSettings {
  double cluster_radius = 2.5;      // Angstrom, neighbourhood radius for grouping outliers
  std::size_t min_cluster_size = 1; // 1: every outlier belongs to some group
};

struct RegionAssignment {
  std::vector<Region> labels;            // per atom
  std::vector<int> outlier_group;        // per atom; -1 for Primary atoms and clustering noise
  std::size_t n_outlier_groups = 0;
  std::vector<std::size_t> seed_atoms;   // provisional Primary (largest in-cell component), sorted

  std::size_t size() const { return labels.size(); }
  bool is_primary(std::size_t i) const { return labels[i] == Region::Primary; }

  std::vector<std::size_t> primary_indices() const { return indices_(Region::Primary); }
  std::vector<std::size_t> outlier_indices() const { return indices_(Region::Outlier); }
  std::size_t n_primary() const { return count_(Region::Primary); }
  std::size_t n_outlier() const { return count_(Region::Outlier); }

  std::vector<bool> primary_mask() const {
    std::vector<bool> m(labels.size());
    for (std::size_t i = 0; i < labels.size(); ++i) m[i] = labels[i] == Region::Primary;
    return m;
  }

  bool operator==(const RegionAssignment& o) const {
    return labels == o.labels && outlier_group == o.outlier_group && n_outlier_groups == o.n_outlier_groups &&
           seed_atoms == o.seed_atoms;
  }
  bool operator!=(const RegionAssignment& o) const { return !(*this == o); }

private:
  std::vector<std::size_t> indices_(Region r) const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < labels.size(); ++i) {
      if (labels[i] == r) out.push_back(i);
    }
    return out;
  }
  std::size_t count_(Region r) const {
    std::size_t n = 0;
    for (auto l : labels) n += (l == r) ? 1u : 0u;
    return n;
  }
};

// Split atoms into the dominant connected network and everything else.
//
// 1) components of the graph restricted to the origin image
// 2) provisional Primary = largest of them; ties go to the lower average
//    atomic number, then to the lower atom index
// 3) Primary = every atom with a node in a shell-graph component that holds
//    a provisional node
// 4) remaining atoms are grouped by density clustering under the
//    minimum-image metric; group ids follow each group's lowest atom index
//
// Throws EmptyPrimaryRegionError for an empty structure.
RegionAssignment separate_regions(const BondGraph& graph, const Structure& s, const RegionSettings& settings);

} // namespace matdim::region
