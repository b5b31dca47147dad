#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace matdim::chem {

constexpr int kMaxAtomicNumber = 118;

// Covalent radius in Angstrom (Cordero et al., Dalton Trans. 2008) for
// Z = 1..96; std::nullopt for anything else.
std::optional<double> covalent_radius(int Z);

// "H".."Og"; "X" for numbers outside 1..118.
std::string element_symbol(int Z);

// Case-sensitive symbol lookup ("Fe", not "FE"); std::nullopt if unknown.
std::optional<int> atomic_number(std::string_view symbol);

struct RadiusLookup {
  double radius = 0.0;
  bool known = false;
};

// Radius lookup with a configurable fallback for species the table does not
// cover, so that unusual chemistry degrades to a warning instead of an error.
class RadiusTable {
public:
  explicit RadiusTable(double default_radius) : default_radius_(default_radius) {}

  RadiusLookup lookup(int Z) const {
    if (auto r = covalent_radius(Z)) return {*r, true};
    return {default_radius_, false};
  }

  double default_radius() const { return default_radius_; }

private:
  double default_radius_;
};

} // namespace matdim::chem
