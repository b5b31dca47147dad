#include "matdim/chem/Elements.hpp"

#include <array>
#include <cstdint>

namespace matdim::chem {

namespace {

// Covalent radii in pm, Z = 0..96 (index 0 unused).
constexpr std::array<std::int16_t, 97> kCovalentRadiusPm = {0,
   31,  28,                                                             // H  He
  128,  96,                                                             // Li Be
   84,  76,  71,  66,  57,  58,                                         // B  C  N  O  F  Ne
  166, 141,                                                             // Na Mg
  121, 111, 107, 105, 102, 106,                                         // Al Si P  S  Cl Ar
  203, 176,                                                             // K  Ca
  170, 160, 153, 139, 139, 132, 126, 124, 132, 122,                     // Sc Ti V  Cr Mn Fe Co Ni Cu Zn
  122, 120, 119, 120, 120, 116,                                         // Ga Ge As Se Br Kr
  220, 195,                                                             // Rb Sr
  190, 175, 164, 154, 147, 146, 142, 139, 145, 144,                     // Y  Zr Nb Mo Tc Ru Rh Pd Ag Cd
  142, 139, 139, 138, 139, 140,                                         // In Sn Sb Te I  Xe
  244, 215,                                                             // Cs Ba
  207, 204, 203, 201, 199, 198, 198, 196, 194, 192, 192, 189, 190, 187, // La Ce Pr Nd Pm Sm Eu Gd Tb Dy Ho Er Tm Yb
  187, 175, 170, 162, 151, 144, 141, 136, 136, 132,                     // Lu Hf Ta W  Re Os Ir Pt Au Hg
  145, 146, 148, 140, 150, 150,                                         // Tl Pb Bi Po At Rn
  260, 221,                                                             // Fr Ra
  215, 206, 200, 196, 190, 187, 180, 169};                              // Ac Th Pa U  Np Pu Am Cm

constexpr std::array<const char*, kMaxAtomicNumber + 1> kSymbols = {"X",
  "H",  "He",
  "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne",
  "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar",
  "K",  "Ca", "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
  "Ga", "Ge", "As", "Se", "Br", "Kr",
  "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd",
  "In", "Sn", "Sb", "Te", "I",  "Xe",
  "Cs", "Ba", "La", "Ce", "Pr", "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb",
  "Lu", "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg",
  "Tl", "Pb", "Bi", "Po", "At", "Rn",
  "Fr", "Ra", "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No",
  "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds", "Rg", "Cn",
  "Nh", "Fl", "Mc", "Lv", "Ts", "Og"};

} // namespace

std::optional<double> covalent_radius(int Z) {
  if (Z < 1 || Z >= static_cast<int>(kCovalentRadiusPm.size())) return std::nullopt;
  return 0.01 * static_cast<double>(kCovalentRadiusPm[static_cast<std::size_t>(Z)]);
}

std::string element_symbol(int Z) {
  if (Z < 1 || Z > kMaxAtomicNumber) return "X";
  return kSymbols[static_cast<std::size_t>(Z)];
}

std::optional<int> atomic_number(std::string_view symbol) {
  for (int Z = 1; Z <= kMaxAtomicNumber; ++Z) {
    if (symbol == kSymbols[static_cast<std::size_t>(Z)]) return Z;
  }
  return std::nullopt;
}

} // namespace matdim::chem
