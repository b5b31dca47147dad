#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "matdim/alg/graph/Components.hpp"
#include "matdim/core/Cell.hpp"
#include "matdim/core/Vec3.hpp"

namespace matdim {

using alg::graph::Edge;
using alg::graph::NodeId;

// An atom in a specific periodic image of the cell.
struct PeriodicNode {
  std::size_t atom = 0;
  Image image{0, 0, 0};
};

// One bonded pair before expansion to shell nodes: atom j translated by
// `translation` lies within bonding distance of atom i.
struct BondRecord {
  std::size_t i = 0;
  std::size_t j = 0;
  Image translation{0, 0, 0};
  double distance = 0.0;

  bool self_image() const { return i == j; }
};

// Bond graph over the original cell plus a shell of periodic images.
//
// - images: every integer triple with components in [-shell, shell] along
//   periodic axes and 0 along non-periodic ones, lexicographically ordered
// - node id = image_index * atom_count + atom
// - edges are undirected, normalized to u < v, sorted and unique after
//   finalize(); self-loops are rejected
// - positions() are the wrapped Cartesian positions the bonds were measured on
//
// The graph is owned by a single classification call.
class BondGraph {
public:
  BondGraph(Cell cell, std::vector<Vec3> wrapped_positions, std::vector<int> numbers, int shell);

  std::size_t atom_count() const { return positions_.size(); }
  std::size_t image_count() const { return images_.size(); }
  std::size_t node_count() const { return images_.size() * positions_.size(); }
  int shell() const { return shell_; }

  const std::vector<Image>& images() const { return images_; }
  std::size_t origin_image() const { return origin_; }
  std::optional<std::size_t> image_index(const Image& img) const;

  NodeId node_id(std::size_t atom, std::size_t image_idx) const { return image_idx * atom_count() + atom; }
  std::optional<NodeId> find_node(std::size_t atom, const Image& img) const;
  PeriodicNode node(NodeId u) const;

  // Expand a bond into every (i, a) -- (j, a + t) edge with both ends in the shell.
  void add_bond(const BondRecord& bond);
  void finalize();
  bool finalized() const { return finalized_; }

  const std::vector<Edge>& edges() const { return edges_; }
  const std::vector<NodeId>& neighbors(NodeId u) const { return adjacency_[u]; }
  std::size_t degree(NodeId u) const { return adjacency_[u].size(); }

  const std::vector<BondRecord>& bonds() const { return bonds_; }
  std::size_t self_image_bond_count() const;

  const Cell& cell() const { return cell_; }
  const std::vector<Vec3>& positions() const { return positions_; }
  const std::vector<int>& numbers() const { return numbers_; }

  // Atoms whose covalent radius fell back to the configured default.
  const std::vector<std::size_t>& defaulted_radius_atoms() const { return defaulted_; }
  void set_defaulted_radius_atoms(std::vector<std::size_t> atoms) { defaulted_ = std::move(atoms); }

  // Node mask selecting every image of the atoms in `atom_mask`.
  std::vector<bool> node_mask(const std::vector<bool>& atom_mask) const;

  // One image per atom such that bonded atoms in `atom_mask` end up
  // spatially contiguous. Breadth-first from each unplaced atom (lowest
  // index first) at the origin image; an atom takes the image of the first
  // of its nodes reached. Atoms outside the mask keep image 0.
  std::vector<Image> placement_images(const std::vector<bool>& atom_mask) const;

  // positions()[k] + T(placement[k]).
  std::vector<Vec3> placed_positions(const std::vector<Image>& placement) const;

private:
  Cell cell_;
  std::vector<Vec3> positions_;
  std::vector<int> numbers_;
  int shell_ = 1;

  std::vector<Image> images_;
  std::size_t origin_ = 0;

  std::vector<BondRecord> bonds_;
  std::vector<Edge> edges_;
  std::vector<std::vector<NodeId>> adjacency_;
  std::vector<std::size_t> defaulted_;
  bool finalized_ = false;
};

} // namespace matdim
