#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "matdim/app/ClassificationResult.hpp"
#include "matdim/config/ClassifierSettings.hpp"
#include "matdim/core/Errors.hpp"
#include "matdim/core/Structure.hpp"
#include "matdim/symmetry/SymmetryDatabase.hpp"

namespace matdim {

// One entry of classify_batch(): a result, or the failure of that structure.
struct BatchOutcome {
  std::optional<ClassificationResult> result;
  std::optional<ErrorKind> error_kind; // unset for non-classification failures (bad input, foreign exceptions)
  std::string error_message;

  bool ok() const { return result.has_value(); }
};

// Structure -> ClassificationResult.
//
// Pass: periodic bond graph, region separation, dimensionality. When the
// propagating directions differ from the periodic ones of the pass, the
// atoms are placed contiguously, periodicity is restricted to the
// propagating directions and the pass is repeated until both agree. The
// last pass is authoritative. Subtype and (for rank >= 1) symmetry follow.
//
// A Classifier holds no mutable state; classify() may be called
// concurrently. The input structure is never modified.
class Classifier {
public:
  explicit Classifier(config::ClassifierSettings settings,
                      std::shared_ptr<const symmetry::SymmetryDatabase> symmetry_db = nullptr);

  const config::ClassifierSettings& settings() const { return settings_; }
  bool has_symmetry_database() const { return symmetry_db_ != nullptr; }

  // Throws ClassificationError (DegenerateCell, InconsistentPeriodicity,
  // SymmetryTimeout, EmptyPrimaryRegion, SymmetryDatabase) or
  // std::runtime_error for malformed input.
  ClassificationResult classify(const Structure& s) const;

  // Independent classify() per structure, parallel across structures when
  // OpenMP is available. Outcomes are in input order.
  std::vector<BatchOutcome> classify_batch(const std::vector<Structure>& structures) const;

private:
  config::ClassifierSettings settings_;
  std::shared_ptr<const symmetry::SymmetryDatabase> symmetry_db_;

  ClassificationResult classify_(const Structure& s, int n_threads) const;
  void report_(const Diagnostic& d) const;
};

} // namespace matdim
