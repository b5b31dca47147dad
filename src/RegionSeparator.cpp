#include "matdim/region/RegionSeparator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "matdim/alg/cluster/DensityCluster.hpp"
#include "matdim/alg/graph/Components.hpp"
#include "matdim/core/Errors.hpp"

namespace matdim::region {

namespace {

using alg::graph::ComponentLabels;
using alg::graph::kNoComponent;

// Pick the provisional Primary among the origin-image components.
std::size_t pick_seed_component(const std::vector<std::vector<std::size_t>>& members,
                                const std::vector<int>& numbers) {
  std::size_t best = 0;
  long long best_z = 0;
  for (std::size_t c = 0; c < members.size(); ++c) {
    long long z = 0;
    for (std::size_t a : members[c]) z += numbers[a];
    if (c == 0) {
      best_z = z;
      continue;
    }
    const std::size_t nb = members[best].size();
    const std::size_t nc = members[c].size();
    if (nc > nb || (nc == nb && z < best_z)) {
      best = c;
      best_z = z;
    }
    // Equal size and equal sum: the earlier component (lower first atom) stays.
  }
  return best;
}

} // namespace

RegionAssignment separate_regions(const BondGraph& graph, const Structure& s, const RegionSettings& settings) {
  const std::size_t n = graph.atom_count();
  if (n == 0) throw EmptyPrimaryRegionError("separate_regions: structure has no atoms", 0);
  if (s.size() != n) throw std::runtime_error("separate_regions: graph/structure atom count mismatch");
  if (!graph.finalized()) throw std::runtime_error("separate_regions: graph is not finalized");

  const std::size_t origin = graph.origin_image();

  // 1) in-cell components. Component ids follow the lowest node id, which
  // inside one image is the lowest atom index.
  std::vector<bool> origin_mask(graph.node_count(), false);
  for (std::size_t a = 0; a < n; ++a) origin_mask[graph.node_id(a, origin)] = true;
  const ComponentLabels local = alg::graph::label_components(graph.node_count(), graph.edges(), origin_mask);

  std::vector<std::vector<std::size_t>> members(local.n_components());
  for (std::size_t a = 0; a < n; ++a) {
    members[local.component_id[graph.node_id(a, origin)]].push_back(a);
  }

  // 2) provisional Primary.
  const std::size_t seed = pick_seed_component(members, graph.numbers());

  RegionAssignment out;
  out.seed_atoms = members[seed];

  // 3) reachability through the shell graph.
  const ComponentLabels full = alg::graph::label_components(graph.node_count(), graph.edges());
  std::vector<bool> primary_component(full.n_components(), false);
  for (std::size_t a : out.seed_atoms) primary_component[full.component_id[graph.node_id(a, origin)]] = true;

  out.labels.assign(n, Region::Outlier);
  for (NodeId u = 0; u < graph.node_count(); ++u) {
    const std::size_t cid = full.component_id[u];
    if (cid != kNoComponent && primary_component[cid]) out.labels[u % n] = Region::Primary;
  }
  if (out.n_primary() == 0) {
    throw EmptyPrimaryRegionError("separate_regions: no atom survived region separation", n);
  }

  // 4) group the outliers.
  out.outlier_group.assign(n, alg::cluster::kNoise);
  const std::vector<std::size_t> outliers = out.outlier_indices();
  if (!outliers.empty()) {
    std::vector<Vec3> points;
    points.reserve(outliers.size());
    for (std::size_t a : outliers) points.push_back(graph.positions()[a]);

    const Cell& cell = graph.cell();
    const auto labels = alg::cluster::density_cluster(
        points, settings.cluster_radius, settings.min_cluster_size,
        [&cell](const Vec3& p, const Vec3& q) { return cell.min_image(p, q).distance; });

    int n_groups = 0;
    for (std::size_t k = 0; k < outliers.size(); ++k) {
      out.outlier_group[outliers[k]] = labels[k];
      n_groups = std::max(n_groups, labels[k] + 1);
    }
    out.n_outlier_groups = static_cast<std::size_t>(n_groups);
  }
  return out;
}

} // namespace matdim::region
