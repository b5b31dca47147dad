#include "matdim/dimensionality/DimensionalityClassifier.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "matdim/alg/graph/Components.hpp"
#include "matdim/core/Errors.hpp"
#include "matdim/geom/Geometry.hpp"

namespace matdim::dimensionality {

namespace {

constexpr double kBandSlack = 1e-6; // Angstrom

std::string join_directions(const std::vector<std::size_t>& dirs) {
  std::string s = "{";
  for (std::size_t k = 0; k < dirs.size(); ++k) {
    if (k) s += ",";
    s += std::to_string(dirs[k]);
  }
  return s + "}";
}

Image unit_image(std::size_t d) {
  Image e{0, 0, 0};
  e[d] = 1;
  return e;
}

} // namespace

std::string dimension_label(std::size_t rank) {
  switch (rank) {
    case 0: return "0D";
    case 1: return "1D";
    case 2: return "2D";
    case 3: return "3D";
    default: break;
  }
  throw std::runtime_error("dimension_label: rank out of range: " + std::to_string(rank));
}

DimensionalityResult classify_dimensionality(const BondGraph& graph,
                                             const region::RegionAssignment& regions,
                                             const Structure& s) {
  const std::size_t n = graph.atom_count();
  if (regions.size() != n) throw std::runtime_error("classify_dimensionality: region/graph atom count mismatch");

  const auto primary = regions.primary_indices();
  const auto labels = alg::graph::label_components(graph.node_count(), graph.edges(),
                                                   graph.node_mask(regions.primary_mask()));

  DimensionalityResult out;
  out.declared = s.n_periodic();

  for (std::size_t d = 0; d < 3; ++d) {
    if (!graph.cell().periodic(d)) continue;
    const Image e = unit_image(d);
    for (std::size_t i : primary) {
      const auto u = graph.find_node(i, Image{0, 0, 0});
      const auto v = graph.find_node(i, e);
      if (u && v && labels.same(*u, *v)) {
        out.directions.push_back(d);
        break;
      }
    }
  }
  out.rank = out.directions.size();

  for (std::size_t d : out.directions) {
    if (!s.is_periodic(d)) {
      throw InconsistentPeriodicityError("classify_dimensionality: direction " + std::to_string(d) +
                                             " propagates but is not declared periodic; measured " +
                                             join_directions(out.directions),
                                         out.rank, out.declared, out.directions, primary);
    }
  }
  if (out.rank > out.declared) {
    throw InconsistentPeriodicityError("classify_dimensionality: measured rank " + std::to_string(out.rank) +
                                           " exceeds " + std::to_string(out.declared) + " declared periodic directions",
                                       out.rank, out.declared, out.directions, primary);
  }
  return out;
}

std::string subtype_name(Subtype t) {
  switch (t) {
    case Subtype::Cluster: return "cluster";
    case Subtype::Chain: return "chain";
    case Subtype::Surface: return "surface";
    case Subtype::Material2D: return "2d_material";
    case Subtype::Bulk: return "bulk";
    case Subtype::Unknown: return "unknown";
  }
  return "unknown";
}

SubtypeResult assign_subtype(const DimensionalityResult& dim,
                             const BondGraph& graph,
                             const region::RegionAssignment& regions,
                             const Cell& declared_cell,
                             const SubtypeSettings& settings) {
  SubtypeResult out;
  switch (dim.rank) {
    case 0: out.subtype = Subtype::Cluster; return out;
    case 1: out.subtype = Subtype::Chain; return out;
    case 3: out.subtype = Subtype::Bulk; return out;
    case 2: break;
    default: throw std::runtime_error("assign_subtype: rank out of range: " + std::to_string(dim.rank));
  }

  const std::size_t p = dim.directions[0];
  const std::size_t q = dim.directions[1];
  const std::size_t r = 3 - p - q;

  Vec3 nrm = cross(graph.cell().vector(p), graph.cell().vector(q));
  nrm = scale(nrm, 1.0 / norm(nrm));
  out.layer_normal = nrm;

  const auto mask = regions.primary_mask();
  const auto placed = graph.placed_positions(graph.placement_images(mask));
  std::vector<Vec3> primary_pos;
  for (std::size_t i = 0; i < placed.size(); ++i) {
    if (mask[i]) primary_pos.push_back(placed[i]);
  }
  const geom::Extent band = geom::extent_along(primary_pos, nrm);
  out.thickness = band.length();

  const bool stacked = declared_cell.periodic(r);
  const double period = stacked ? std::abs(dot(declared_cell.vector(r), nrm)) : 0.0;
  out.vacuum_gap = stacked ? period - out.thickness : std::numeric_limits<double>::infinity();

  // Height above the bottom of the band, folded into one period when stacked.
  for (std::size_t i : regions.outlier_indices()) {
    double rel = dot(graph.positions()[i], nrm) - band.min;
    bool inside = false;
    if (stacked && period > 0.0) {
      rel -= period * std::floor(rel / period);
      inside = rel <= out.thickness + kBandSlack || rel >= period - kBandSlack;
    } else {
      inside = rel >= -kBandSlack && rel <= out.thickness + kBandSlack;
    }
    if (inside) {
      out.outlier_in_layer = true;
      break;
    }
  }

  out.vacuum_only = out.vacuum_gap >= settings.vacuum_threshold && !out.outlier_in_layer;
  if (!out.vacuum_only) {
    out.subtype = Subtype::Unknown;
  } else if (out.thickness <= settings.max_2d_thickness) {
    out.subtype = Subtype::Material2D;
  } else {
    out.subtype = Subtype::Surface;
  }
  return out;
}

} // namespace matdim::dimensionality
