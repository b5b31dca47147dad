#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace matdim::alg::graph {

using NodeId = std::size_t;
using Edge = std::pair<NodeId, NodeId>; // undirected (u,v), u < v

constexpr std::size_t kNoComponent = static_cast<std::size_t>(-1);

// Disjoint-set / union-find for undirected connectivity.
class UnionFind {
public:
  explicit UnionFind(std::size_t n = 0) { reset(n); }

  void reset(std::size_t n) {
    parent_.resize(n);
    rank_.assign(n, 0);
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  std::size_t size() const { return parent_.size(); }

  std::size_t find(std::size_t x) {
    if (x >= parent_.size()) throw std::runtime_error("UnionFind: find() out of range");
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x = parent_[x];
    }
    return x;
  }

  void unite(std::size_t a, std::size_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (rank_[a] < rank_[b]) std::swap(a, b);
    parent_[b] = a;
    if (rank_[a] == rank_[b]) ++rank_[a];
  }

  bool connected(std::size_t a, std::size_t b) { return find(a) == find(b); }

private:
  std::vector<std::size_t> parent_;
  std::vector<unsigned char> rank_;
};

// Component labels over a node subset.
//
// Component ids are assigned in order of each component's lowest node id,
// so labelling does not depend on edge order. Nodes outside the mask get
// kNoComponent.
struct ComponentLabels {
  std::vector<std::size_t> component_id;    // size = n_nodes
  std::vector<std::size_t> component_sizes; // indexed by component id

  std::size_t n_components() const { return component_sizes.size(); }
  bool same(NodeId u, NodeId v) const {
    return component_id[u] != kNoComponent && component_id[u] == component_id[v];
  }
};

// `mask` empty means "all nodes". Edges touching a masked-out node are ignored.
inline ComponentLabels label_components(std::size_t n_nodes,
                                        const std::vector<Edge>& edges,
                                        const std::vector<bool>& mask = {}) {
  if (!mask.empty() && mask.size() != n_nodes) {
    throw std::runtime_error("label_components: mask size does not match node count");
  }
  auto in = [&](NodeId u) { return mask.empty() || mask[u]; };

  UnionFind uf(n_nodes);
  for (const auto& e : edges) {
    if (e.first >= n_nodes || e.second >= n_nodes) {
      throw std::runtime_error("label_components: edge endpoint out of range");
    }
    if (in(e.first) && in(e.second)) uf.unite(e.first, e.second);
  }

  ComponentLabels r;
  r.component_id.assign(n_nodes, kNoComponent);
  std::vector<std::size_t> root_to_cid(n_nodes, kNoComponent);
  for (NodeId u = 0; u < n_nodes; ++u) {
    if (!in(u)) continue;
    const std::size_t root = uf.find(u);
    if (root_to_cid[root] == kNoComponent) {
      root_to_cid[root] = r.component_sizes.size();
      r.component_sizes.push_back(0);
    }
    const std::size_t cid = root_to_cid[root];
    r.component_id[u] = cid;
    ++r.component_sizes[cid];
  }
  return r;
}

} // namespace matdim::alg::graph
