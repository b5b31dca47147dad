#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <stdexcept>
#include <vector>

#include "matdim/core/Vec3.hpp"

namespace matdim::alg::cluster {

constexpr int kNoise = -1;

using DistanceFn = std::function<double(const Vec3&, const Vec3&)>;

inline double euclidean(const Vec3& a, const Vec3& b) { return norm(sub(b, a)); }

// Density-based clustering (DBSCAN semantics).
//
// - neighbourhood of p: points q with metric(p, q) <= neighbor_radius, p included
// - core point: neighbourhood size >= min_cluster_size
// - clusters grow from core points in index order; a border point joins the
//   cluster of its lowest-index core neighbour
// - everything else is noise (kNoise)
//
// Labels are renumbered 0..k-1 in order of each cluster's lowest member
// index, so the result does not depend on the order in which clusters were
// discovered.
inline std::vector<int> density_cluster(const std::vector<Vec3>& points,
                                        double neighbor_radius,
                                        std::size_t min_cluster_size,
                                        const DistanceFn& metric = euclidean) {
  if (!(neighbor_radius > 0.0)) throw std::runtime_error("density_cluster: neighbor_radius must be positive");
  if (min_cluster_size < 1) throw std::runtime_error("density_cluster: min_cluster_size must be >= 1");

  const std::size_t n = points.size();
  std::vector<std::vector<std::size_t>> nbrs(n);
  for (std::size_t i = 0; i < n; ++i) {
    nbrs[i].push_back(i);
    for (std::size_t j = i + 1; j < n; ++j) {
      if (metric(points[i], points[j]) <= neighbor_radius) {
        nbrs[i].push_back(j);
        nbrs[j].push_back(i);
      }
    }
  }
  for (auto& v : nbrs) std::sort(v.begin(), v.end());

  std::vector<bool> core(n, false);
  for (std::size_t i = 0; i < n; ++i) core[i] = nbrs[i].size() >= min_cluster_size;

  // Core points: connected components over core-core adjacency.
  std::vector<int> raw(n, kNoise);
  int next = 0;
  std::deque<std::size_t> q;
  for (std::size_t s = 0; s < n; ++s) {
    if (!core[s] || raw[s] != kNoise) continue;
    raw[s] = next;
    q.clear();
    q.push_back(s);
    while (!q.empty()) {
      const std::size_t u = q.front();
      q.pop_front();
      for (std::size_t v : nbrs[u]) {
        if (!core[v] || raw[v] != kNoise) continue;
        raw[v] = next;
        q.push_back(v);
      }
    }
    ++next;
  }

  // Border points.
  for (std::size_t i = 0; i < n; ++i) {
    if (core[i]) continue;
    for (std::size_t v : nbrs[i]) {
      if (core[v]) {
        raw[i] = raw[v];
        break;
      }
    }
  }

  std::vector<int> remap(static_cast<std::size_t>(next), kNoise);
  int k = 0;
  std::vector<int> labels(n, kNoise);
  for (std::size_t i = 0; i < n; ++i) {
    if (raw[i] == kNoise) continue;
    auto& m = remap[static_cast<std::size_t>(raw[i])];
    if (m == kNoise) m = k++;
    labels[i] = m;
  }
  return labels;
}

} // namespace matdim::alg::cluster
