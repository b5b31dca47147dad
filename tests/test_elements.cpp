#include <gtest/gtest.h>

#include "matdim/chem/Elements.hpp"

using namespace matdim::chem;

TEST(ElementsTest, CovalentRadiiInAngstrom) {
  EXPECT_NEAR(*covalent_radius(1), 0.31, 1e-12);
  EXPECT_NEAR(*covalent_radius(6), 0.76, 1e-12);
  EXPECT_NEAR(*covalent_radius(11), 1.66, 1e-12);
  EXPECT_NEAR(*covalent_radius(14), 1.11, 1e-12);
  EXPECT_NEAR(*covalent_radius(17), 1.02, 1e-12);
  EXPECT_NEAR(*covalent_radius(79), 1.36, 1e-12);
  EXPECT_NEAR(*covalent_radius(96), 1.69, 1e-12);
}

TEST(ElementsTest, NoRadiusOutsideTable) {
  EXPECT_FALSE(covalent_radius(0).has_value());
  EXPECT_FALSE(covalent_radius(-3).has_value());
  EXPECT_FALSE(covalent_radius(97).has_value());
  EXPECT_FALSE(covalent_radius(250).has_value());
}

TEST(ElementsTest, RadiusTableFallsBackToDefault) {
  const RadiusTable table(1.5);
  const auto c = table.lookup(6);
  EXPECT_TRUE(c.known);
  EXPECT_NEAR(c.radius, 0.76, 1e-12);

  const auto x = table.lookup(118);
  EXPECT_FALSE(x.known);
  EXPECT_DOUBLE_EQ(x.radius, 1.5);
}

TEST(ElementsTest, Symbols) {
  EXPECT_EQ(element_symbol(1), "H");
  EXPECT_EQ(element_symbol(26), "Fe");
  EXPECT_EQ(element_symbol(118), "Og");
  EXPECT_EQ(element_symbol(0), "X");
  EXPECT_EQ(element_symbol(119), "X");

  EXPECT_EQ(atomic_number("Si"), 14);
  EXPECT_EQ(atomic_number("Cl"), 17);
  EXPECT_FALSE(atomic_number("CL").has_value());
  EXPECT_FALSE(atomic_number("Xx").has_value());

  for (int Z = 1; Z <= kMaxAtomicNumber; ++Z) EXPECT_EQ(atomic_number(element_symbol(Z)), Z);
}
