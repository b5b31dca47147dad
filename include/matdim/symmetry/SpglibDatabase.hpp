#pragma once

#include <atomic>
#include <string>

#include "matdim/symmetry/SymmetryDatabase.hpp"

namespace matdim::symmetry {

// SymmetryDatabase backed by spglib (spg_get_dataset).
//
// spglib cannot be interrupted; a cancelled search runs to completion on its
// worker thread and the result is dropped.
class SpglibDatabase final : public SymmetryDatabase {
public:
  std::string name() const override;
  SymmetryDataset find_symmetry(const SymmetryRequest& request, const std::atomic<bool>& cancelled) const override;
};

} // namespace matdim::symmetry
