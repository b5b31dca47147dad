#pragma once

#include <chrono>
#include <filesystem>

#include "matdim/alg/neighbor/PeriodicGraphBuilder.hpp"
#include "matdim/config/IniConfig.hpp"
#include "matdim/dimensionality/DimensionalityClassifier.hpp"
#include "matdim/region/RegionSeparator.hpp"

namespace matdim::config {

struct SymmetrySettings {
  bool enabled = true;
  double tolerance = 0.1;                       // Angstrom
  std::chrono::milliseconds timeout{10000};     // <= 0: no timeout, run inline
  double vacuum_padding = 5.0;                  // Angstrom, see make_primary_substructure
};

struct RunSettings {
  bool log_warnings = false; // mirror diagnostics to stderr
  int n_threads = 0;         // <= 0: OpenMP default
};

// Every tunable of a classification call. Passed by value into the
// classifier; nothing here is process-wide.
//
// INI layout:
//   [graph]          radius_factor, bond_tolerance, max_translation_shell,
//                    default_radius, volume_tolerance
//   [regions]        cluster_radius, min_cluster_size
//   [dimensionality] vacuum_threshold, max_2d_thickness
//   [symmetry]       enabled, tolerance, timeout_ms, vacuum_padding
//   [run]            log_warnings, n_threads
// Missing keys keep their defaults; unknown sections or keys are errors.
struct ClassifierSettings {
  alg::neighbor::GraphSettings graph;
  region::RegionSettings regions;
  dimensionality::SubtypeSettings dimensionality;
  SymmetrySettings symmetry;
  RunSettings run;

  static ClassifierSettings from_ini(const IniConfig& ini);
  static ClassifierSettings from_file(const std::filesystem::path& file) { return from_ini(IniConfig(file)); }

  // Throws std::runtime_error naming the first out-of-range value.
  void validate() const;
};

} // namespace matdim::config
