#include <gtest/gtest.h>

#include "Fixtures.hpp"
#include "matdim/alg/neighbor/PeriodicGraphBuilder.hpp"
#include "matdim/core/Errors.hpp"
#include "matdim/region/RegionSeparator.hpp"

using namespace matdim;
using matdim::alg::neighbor::GraphSettings;
using matdim::alg::neighbor::build_periodic_graph;
using matdim::region::Region;
using matdim::region::RegionSettings;
using matdim::region::separate_regions;

namespace {

region::RegionAssignment separate(const Structure& s, const RegionSettings& rs = {}) {
  const BondGraph g = build_periodic_graph(s, GraphSettings{});
  return separate_regions(g, s, rs);
}

// 2x2 carbon slab (4 layers, z = 5 .. 9.5) with two H2 molecules in the vacuum.
Structure slab_with_two_molecules() {
  Structure s = fixtures::carbon_slab(4, 5.0, 15.0, 2);
  s.add_atom(1, {0.0, 0.0, 12.5});
  s.add_atom(1, {0.74, 0.0, 12.5});
  s.add_atom(1, {0.0, 0.0, 16.5 - 15.0});
  s.add_atom(1, {0.74, 0.0, 16.5 - 15.0});
  return s;
}

} // namespace

TEST(RegionSeparatorTest, MoleculeIsAllPrimary) {
  const auto r = separate(fixtures::hydrogen_molecule());
  EXPECT_EQ(r.n_primary(), 2u);
  EXPECT_EQ(r.n_outlier(), 0u);
  EXPECT_EQ(r.n_outlier_groups, 0u);
  EXPECT_EQ(r.outlier_group, (std::vector<int>{-1, -1}));
  EXPECT_EQ(r.seed_atoms, (std::vector<std::size_t>{0, 1}));
}

TEST(RegionSeparatorTest, AdsorbedMoleculesAreGroupedOutliers) {
  const Structure s = slab_with_two_molecules();
  const auto r = separate(s);

  ASSERT_EQ(r.size(), 20u);
  for (std::size_t i = 0; i < 16; ++i) EXPECT_EQ(r.labels[i], Region::Primary) << "atom " << i;
  EXPECT_EQ(r.outlier_indices(), (std::vector<std::size_t>{16, 17, 18, 19}));
  EXPECT_EQ(r.n_outlier_groups, 2u);
  EXPECT_EQ(r.outlier_group[16], 0);
  EXPECT_EQ(r.outlier_group[17], 0);
  EXPECT_EQ(r.outlier_group[18], 1);
  EXPECT_EQ(r.outlier_group[19], 1);
  EXPECT_EQ(r.outlier_group[0], -1);
}

TEST(RegionSeparatorTest, LargeClusterRadiusMergesOutlierGroups) {
  RegionSettings rs;
  rs.cluster_radius = 4.5;
  const auto r = separate(slab_with_two_molecules(), rs);
  EXPECT_EQ(r.n_outlier_groups, 1u);
}

TEST(RegionSeparatorTest, MinClusterSizeLeavesNoise) {
  Structure s = fixtures::carbon_slab(2, 5.0, 15.0, 2);
  s.add_atom(1, {0.0, 0.0, 11.0}); // lone adatom
  RegionSettings rs;
  rs.min_cluster_size = 2;
  const auto r = separate(s, rs);
  EXPECT_EQ(r.labels.back(), Region::Outlier);
  EXPECT_EQ(r.outlier_group.back(), -1);
  EXPECT_EQ(r.n_outlier_groups, 0u);
}

TEST(RegionSeparatorTest, SlabSplitByCellBoundaryStaysPrimary) {
  // Layers at z = 12, 13.5, 0, 1.5: the origin image holds two equal
  // halves, which reconnect through the periodic images.
  const Structure s = fixtures::carbon_slab(4, 12.0, 15.0, 2);
  const auto r = separate(s);
  EXPECT_EQ(r.n_primary(), 16u);
  EXPECT_EQ(r.n_outlier(), 0u);
  // Tie on size and composition: the half holding atom 0 wins.
  EXPECT_EQ(r.seed_atoms, (std::vector<std::size_t>{0, 1, 2, 3, 4, 5, 6, 7}));
}

TEST(RegionSeparatorTest, TieBreakPrefersLowerAverageAtomicNumber) {
  // Two separate diatomics of equal size, the lighter one listed second.
  Structure s;
  s.add_atom(9, {0, 0, 0});
  s.add_atom(9, {1.3, 0, 0});
  s.add_atom(1, {0, 10, 0});
  s.add_atom(1, {0.74, 10, 0});
  const auto r = separate(s);
  EXPECT_EQ(r.seed_atoms, (std::vector<std::size_t>{2, 3}));
  EXPECT_EQ(r.primary_indices(), (std::vector<std::size_t>{2, 3}));
  EXPECT_EQ(r.outlier_group[0], 0);
  EXPECT_EQ(r.outlier_group[1], 0);
}

TEST(RegionSeparatorTest, Deterministic) {
  const Structure s = slab_with_two_molecules();
  EXPECT_EQ(separate(s), separate(s));

  region::RegionAssignment other = separate(s);
  other.seed_atoms.push_back(other.size());
  EXPECT_NE(separate(s), other);
  other = separate(s);
  other.n_outlier_groups += 1;
  EXPECT_NE(separate(s), other);
}

TEST(RegionSeparatorTest, EmptyStructureThrows) {
  const Structure s;
  const BondGraph g = build_periodic_graph(s, GraphSettings{});
  EXPECT_THROW(separate_regions(g, s, RegionSettings{}), EmptyPrimaryRegionError);
}
