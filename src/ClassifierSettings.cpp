#include "matdim/config/ClassifierSettings.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace matdim::config {

namespace {

void require(bool ok, const std::string& what) {
  if (!ok) throw std::runtime_error("ClassifierSettings: " + what);
}

bool positive(double x) { return std::isfinite(x) && x > 0.0; }

int to_int(std::int64_t v, const std::string& name) {
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw std::runtime_error("ClassifierSettings: " + name + " out of range: " + std::to_string(v));
  }
  return static_cast<int>(v);
}

} // namespace

ClassifierSettings ClassifierSettings::from_ini(const IniConfig& ini) {
  ini.require_known({
      {"graph", {"radius_factor", "bond_tolerance", "max_translation_shell", "default_radius", "volume_tolerance"}},
      {"regions", {"cluster_radius", "min_cluster_size"}},
      {"dimensionality", {"vacuum_threshold", "max_2d_thickness"}},
      {"symmetry", {"enabled", "tolerance", "timeout_ms", "vacuum_padding"}},
      {"run", {"log_warnings", "n_threads"}},
  });

  ClassifierSettings s;

  s.graph.radius_factor = ini.get_double("graph", "radius_factor", s.graph.radius_factor);
  s.graph.bond_tolerance = ini.get_double("graph", "bond_tolerance", s.graph.bond_tolerance);
  s.graph.max_translation_shell =
      to_int(ini.get_int64("graph", "max_translation_shell", s.graph.max_translation_shell), "graph.max_translation_shell");
  s.graph.default_radius = ini.get_double("graph", "default_radius", s.graph.default_radius);
  s.graph.volume_tolerance = ini.get_double("graph", "volume_tolerance", s.graph.volume_tolerance);

  s.regions.cluster_radius = ini.get_double("regions", "cluster_radius", s.regions.cluster_radius);
  const auto min_size = ini.get_int64("regions", "min_cluster_size", static_cast<std::int64_t>(s.regions.min_cluster_size));
  require(min_size >= 1, "regions.min_cluster_size must be >= 1, got " + std::to_string(min_size));
  s.regions.min_cluster_size = static_cast<std::size_t>(min_size);

  s.dimensionality.vacuum_threshold = ini.get_double("dimensionality", "vacuum_threshold", s.dimensionality.vacuum_threshold);
  s.dimensionality.max_2d_thickness = ini.get_double("dimensionality", "max_2d_thickness", s.dimensionality.max_2d_thickness);

  s.symmetry.enabled = ini.get_bool("symmetry", "enabled", s.symmetry.enabled);
  s.symmetry.tolerance = ini.get_double("symmetry", "tolerance", s.symmetry.tolerance);
  s.symmetry.timeout = std::chrono::milliseconds(ini.get_int64("symmetry", "timeout_ms", s.symmetry.timeout.count()));
  s.symmetry.vacuum_padding = ini.get_double("symmetry", "vacuum_padding", s.symmetry.vacuum_padding);

  s.run.log_warnings = ini.get_bool("run", "log_warnings", s.run.log_warnings);
  s.run.n_threads = to_int(ini.get_int64("run", "n_threads", s.run.n_threads), "run.n_threads");
  s.graph.n_threads = s.run.n_threads;

  s.validate();
  return s;
}

void ClassifierSettings::validate() const {
  require(positive(graph.radius_factor), "graph.radius_factor must be positive");
  require(std::isfinite(graph.bond_tolerance) && graph.bond_tolerance >= 0.0, "graph.bond_tolerance must be >= 0");
  require(graph.max_translation_shell >= 1, "graph.max_translation_shell must be >= 1");
  require(positive(graph.default_radius), "graph.default_radius must be positive");
  require(positive(graph.volume_tolerance) && graph.volume_tolerance < 1.0, "graph.volume_tolerance must be in (0, 1)");

  require(positive(regions.cluster_radius), "regions.cluster_radius must be positive");
  require(regions.min_cluster_size >= 1, "regions.min_cluster_size must be >= 1");

  require(std::isfinite(dimensionality.vacuum_threshold) && dimensionality.vacuum_threshold >= 0.0,
          "dimensionality.vacuum_threshold must be >= 0");
  require(std::isfinite(dimensionality.max_2d_thickness) && dimensionality.max_2d_thickness >= 0.0,
          "dimensionality.max_2d_thickness must be >= 0");

  require(positive(symmetry.tolerance), "symmetry.tolerance must be positive");
  require(std::isfinite(symmetry.vacuum_padding) && symmetry.vacuum_padding >= 0.0,
          "symmetry.vacuum_padding must be >= 0");
}

} // namespace matdim::config
