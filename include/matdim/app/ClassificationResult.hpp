#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "matdim/dimensionality/DimensionalityClassifier.hpp"
#include "matdim/region/RegionSeparator.hpp"
#include "matdim/symmetry/SymmetryAdapter.hpp"

namespace matdim {

// Non-fatal finding of a classification call.
//   unknown_species       radius defaulted for the listed atoms
//   periodicity_override  measured periodicity replaced the declared one
//   symmetry_unavailable  rank >= 1 but no symmetry database configured
struct Diagnostic {
  std::string code;
  std::string message;
  std::vector<std::size_t> atoms;
};

// Wall-clock seconds per stage, summed over all passes.
struct Timings {
  double graph = 0.0;
  double regions = 0.0;
  double dimensionality = 0.0;
  double symmetry = 0.0;
  double total = 0.0;
};

class ClassificationResult {
public:
  struct Fields {
    dimensionality::DimensionalityResult dimensionality;
    dimensionality::SubtypeResult subtype;
    region::RegionAssignment regions;
    std::optional<symmetry::SymmetrySummary> symmetry;
    std::vector<Diagnostic> diagnostics;
    std::array<bool,3> declared_periodicity{false, false, false};
    std::array<bool,3> effective_periodicity{false, false, false};
    std::size_t passes = 1;
    Timings timings;
  };

  explicit ClassificationResult(Fields f) : f_(std::move(f)) {}

  std::size_t rank() const { return f_.dimensionality.rank; }
  std::string dimension_label() const { return dimensionality::dimension_label(f_.dimensionality.rank); }
  dimensionality::Subtype subtype() const { return f_.subtype.subtype; }
  const dimensionality::DimensionalityResult& dimensionality() const { return f_.dimensionality; }
  const dimensionality::SubtypeResult& subtype_details() const { return f_.subtype; }

  const region::RegionAssignment& regions() const { return f_.regions; }
  const std::optional<symmetry::SymmetrySummary>& symmetry() const { return f_.symmetry; }

  const std::vector<Diagnostic>& diagnostics() const { return f_.diagnostics; }
  bool has_diagnostic(const std::string& code) const {
    for (const auto& d : f_.diagnostics) {
      if (d.code == code) return true;
    }
    return false;
  }

  const std::array<bool,3>& declared_periodicity() const { return f_.declared_periodicity; }
  // Periodicity of the final, authoritative pass.
  const std::array<bool,3>& effective_periodicity() const { return f_.effective_periodicity; }
  bool periodicity_overridden() const { return f_.declared_periodicity != f_.effective_periodicity; }
  std::size_t passes() const { return f_.passes; }

  const Timings& timings() const { return f_.timings; }

private:
  Fields f_;
};

} // namespace matdim
