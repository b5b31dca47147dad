#include "matdim/topology/BondGraph.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>
#include <utility>

namespace matdim {

BondGraph::BondGraph(Cell cell, std::vector<Vec3> wrapped_positions, std::vector<int> numbers, int shell)
    : cell_(std::move(cell)), positions_(std::move(wrapped_positions)), numbers_(std::move(numbers)), shell_(shell) {
  if (shell_ < 1) throw std::runtime_error("BondGraph: translation shell must be >= 1");
  if (numbers_.size() != positions_.size()) {
    throw std::runtime_error("BondGraph: positions/numbers size mismatch");
  }

  const int lo[3] = {cell_.periodic(0) ? -shell_ : 0, cell_.periodic(1) ? -shell_ : 0, cell_.periodic(2) ? -shell_ : 0};
  const int hi[3] = {cell_.periodic(0) ? shell_ : 0, cell_.periodic(1) ? shell_ : 0, cell_.periodic(2) ? shell_ : 0};
  for (int i = lo[0]; i <= hi[0]; ++i) {
    for (int j = lo[1]; j <= hi[1]; ++j) {
      for (int k = lo[2]; k <= hi[2]; ++k) {
        const Image img{i, j, k};
        if (is_zero(img)) origin_ = images_.size();
        images_.push_back(img);
      }
    }
  }
  adjacency_.assign(node_count(), {});
}

std::optional<std::size_t> BondGraph::image_index(const Image& img) const {
  const std::size_t width = static_cast<std::size_t>(2 * shell_ + 1);
  std::size_t idx = 0;
  for (std::size_t d = 0; d < 3; ++d) {
    if (!cell_.periodic(d)) {
      if (img[d] != 0) return std::nullopt;
      continue;
    }
    if (img[d] < -shell_ || img[d] > shell_) return std::nullopt;
    idx = idx * width + static_cast<std::size_t>(img[d] + shell_);
  }
  return idx;
}

std::optional<NodeId> BondGraph::find_node(std::size_t atom, const Image& img) const {
  if (atom >= atom_count()) return std::nullopt;
  if (auto idx = image_index(img)) return node_id(atom, *idx);
  return std::nullopt;
}

PeriodicNode BondGraph::node(NodeId u) const {
  if (u >= node_count()) throw std::runtime_error("BondGraph: node id out of range");
  PeriodicNode n;
  n.atom = u % atom_count();
  n.image = images_[u / atom_count()];
  return n;
}

void BondGraph::add_bond(const BondRecord& bond) {
  if (finalized_) throw std::runtime_error("BondGraph: add_bond() after finalize()");
  if (bond.i >= atom_count() || bond.j >= atom_count()) {
    throw std::runtime_error("BondGraph: bond atom index out of range");
  }
  if (bond.i == bond.j && is_zero(bond.translation)) {
    throw std::runtime_error("BondGraph: self-loop on atom " + std::to_string(bond.i));
  }

  bonds_.push_back(bond);
  for (std::size_t ia = 0; ia < images_.size(); ++ia) {
    const auto ib = image_index(add(images_[ia], bond.translation));
    if (!ib) continue;
    NodeId u = node_id(bond.i, ia);
    NodeId v = node_id(bond.j, *ib);
    if (u > v) std::swap(u, v);
    edges_.emplace_back(u, v);
  }
}

void BondGraph::finalize() {
  if (finalized_) return;
  std::sort(edges_.begin(), edges_.end());
  edges_.erase(std::unique(edges_.begin(), edges_.end()), edges_.end());
  for (const auto& e : edges_) {
    adjacency_[e.first].push_back(e.second);
    adjacency_[e.second].push_back(e.first);
  }
  for (auto& nbrs : adjacency_) std::sort(nbrs.begin(), nbrs.end());
  finalized_ = true;
}

std::size_t BondGraph::self_image_bond_count() const {
  return static_cast<std::size_t>(
      std::count_if(bonds_.begin(), bonds_.end(), [](const BondRecord& b) { return b.self_image(); }));
}

std::vector<bool> BondGraph::node_mask(const std::vector<bool>& atom_mask) const {
  if (atom_mask.size() != atom_count()) throw std::runtime_error("BondGraph: atom mask size mismatch");
  std::vector<bool> mask(node_count(), false);
  for (NodeId u = 0; u < node_count(); ++u) {
    mask[u] = atom_mask[u % atom_count()];
  }
  return mask;
}

std::vector<Image> BondGraph::placement_images(const std::vector<bool>& atom_mask) const {
  if (atom_mask.size() != atom_count()) throw std::runtime_error("BondGraph: atom mask size mismatch");
  const std::size_t n = atom_count();
  std::vector<Image> placement(n, Image{0, 0, 0});
  std::vector<bool> placed(n, false);
  std::vector<bool> visited(node_count(), false);
  std::deque<NodeId> q;

  for (std::size_t start = 0; start < n; ++start) {
    if (!atom_mask[start] || placed[start]) continue;
    const NodeId s = node_id(start, origin_);
    placed[start] = true;
    visited[s] = true;
    q.clear();
    q.push_back(s);
    while (!q.empty()) {
      const NodeId u = q.front();
      q.pop_front();
      for (const NodeId v : adjacency_[u]) {
        if (visited[v]) continue;
        const std::size_t k = v % n;
        if (!atom_mask[k]) continue;
        visited[v] = true;
        if (!placed[k]) {
          placed[k] = true;
          placement[k] = images_[v / n];
        }
        q.push_back(v);
      }
    }
  }
  return placement;
}

std::vector<Vec3> BondGraph::placed_positions(const std::vector<Image>& placement) const {
  if (placement.size() != atom_count()) throw std::runtime_error("BondGraph: placement size mismatch");
  std::vector<Vec3> out(atom_count());
  for (std::size_t k = 0; k < atom_count(); ++k) {
    out[k] = add(positions_[k], cell_.translation(placement[k]));
  }
  return out;
}

} // namespace matdim
