#include <gtest/gtest.h>

#include <algorithm>

#include "Fixtures.hpp"
#include "matdim/alg/neighbor/PeriodicGraphBuilder.hpp"
#include "matdim/core/Errors.hpp"

using namespace matdim;
using matdim::alg::neighbor::GraphSettings;
using matdim::alg::neighbor::build_periodic_graph;

TEST(PeriodicGraphBuilderTest, SelfImageBondsInSimpleCubic) {
  const Structure s = fixtures::simple_cubic_carbon(1.5);
  const BondGraph g = build_periodic_graph(s, GraphSettings{});

  EXPECT_EQ(g.image_count(), 27u);
  EXPECT_EQ(g.node_count(), 27u);
  EXPECT_EQ(g.bonds().size(), 3u);
  EXPECT_EQ(g.self_image_bond_count(), 3u);
  // 3 axes x 2 x 3 x 3 image pairs.
  EXPECT_EQ(g.edges().size(), 54u);

  const auto origin = g.node_id(0, g.origin_image());
  EXPECT_EQ(g.degree(origin), 6u);
  for (const auto& e : g.edges()) EXPECT_LT(e.first, e.second);
}

TEST(PeriodicGraphBuilderTest, NonPeriodicHasSingleImage) {
  const Structure s = fixtures::hydrogen_molecule();
  const BondGraph g = build_periodic_graph(s, GraphSettings{});
  EXPECT_EQ(g.image_count(), 1u);
  EXPECT_EQ(g.origin_image(), 0u);
  ASSERT_EQ(g.edges().size(), 1u);
  EXPECT_EQ(g.edges()[0], (Edge{0, 1}));
  EXPECT_NEAR(g.bonds()[0].distance, 0.74, 1e-12);
}

TEST(PeriodicGraphBuilderTest, ImagesOnlyAlongPeriodicAxes) {
  const Structure s = fixtures::carbon_chain({true, false, false});
  const BondGraph g = build_periodic_graph(s, GraphSettings{});
  EXPECT_EQ(g.image_count(), 3u);
  EXPECT_TRUE(g.image_index(Image{1, 0, 0}).has_value());
  EXPECT_FALSE(g.image_index(Image{0, 1, 0}).has_value());
  EXPECT_FALSE(g.image_index(Image{2, 0, 0}).has_value());
  EXPECT_EQ(g.self_image_bond_count(), 1u);
  EXPECT_EQ(g.edges().size(), 2u);
}

TEST(PeriodicGraphBuilderTest, WiderShell) {
  GraphSettings gs;
  gs.max_translation_shell = 2;
  const BondGraph g = build_periodic_graph(fixtures::carbon_chain({true, false, false}), gs);
  EXPECT_EQ(g.image_count(), 5u);
  EXPECT_EQ(g.edges().size(), 4u);
}

TEST(PeriodicGraphBuilderTest, ThresholdIsTunable) {
  Structure s;
  s.add_atom(6, {0, 0, 0});
  s.add_atom(6, {1.519, 0, 0});

  GraphSettings gs;
  gs.radius_factor = 1.0;
  gs.bond_tolerance = 0.0;
  EXPECT_EQ(build_periodic_graph(s, gs).edges().size(), 1u);

  s.atoms[1].position[0] = 1.53;
  EXPECT_EQ(build_periodic_graph(s, gs).edges().size(), 0u);

  gs.bond_tolerance = 0.1;
  EXPECT_EQ(build_periodic_graph(s, gs).edges().size(), 1u);
}

TEST(PeriodicGraphBuilderTest, BondsAcrossCellBoundaryUseWrappedPositions) {
  Structure s = fixtures::cubic(10.0);
  s.add_atom(6, {-0.7, 5, 5});
  s.add_atom(6, {0.7, 5, 5});
  const BondGraph g = build_periodic_graph(s, GraphSettings{});
  EXPECT_NEAR(g.positions()[0][0], 9.3, 1e-12);
  ASSERT_EQ(g.bonds().size(), 1u);
  EXPECT_EQ(g.bonds()[0].translation, (Image{1, 0, 0}));
  EXPECT_NEAR(g.bonds()[0].distance, 1.4, 1e-12);
}

TEST(PeriodicGraphBuilderTest, UnknownSpeciesUseDefaultRadius) {
  Structure s;
  s.add_atom(6, {0, 0, 0});
  s.add_atom(110, {2.5, 0, 0});

  GraphSettings gs;
  const BondGraph g = build_periodic_graph(s, gs);
  EXPECT_EQ(g.defaulted_radius_atoms(), (std::vector<std::size_t>{1}));
  // 1.1 * (0.76 + 1.5) + 0.1 = 2.586
  EXPECT_EQ(g.edges().size(), 1u);

  gs.default_radius = 1.0;
  EXPECT_EQ(build_periodic_graph(s, gs).edges().size(), 0u);
}

TEST(PeriodicGraphBuilderTest, SelfLoopIsRejected) {
  BondGraph g = build_periodic_graph(fixtures::hydrogen_molecule(), GraphSettings{});
  EXPECT_TRUE(g.finalized());
  EXPECT_THROW(g.add_bond(BondRecord{0, 1, Image{0, 0, 0}, 0.7}), std::runtime_error);

  BondGraph fresh(Cell(), {Vec3{0, 0, 0}}, {1}, 1);
  EXPECT_THROW(fresh.add_bond(BondRecord{0, 0, Image{0, 0, 0}, 0.0}), std::runtime_error);
}

TEST(PeriodicGraphBuilderTest, InvalidShellThrows) {
  GraphSettings gs;
  gs.max_translation_shell = 0;
  EXPECT_THROW(build_periodic_graph(fixtures::carbon_chain(), gs), std::runtime_error);
}

TEST(PeriodicGraphBuilderTest, DegenerateCellThrows) {
  Structure s;
  s.lattice = {Vec3{1, 0, 0}, Vec3{2, 0, 0}, Vec3{0, 0, 1}};
  s.periodic = {true, true, true};
  s.add_atom(6, {0, 0, 0});
  EXPECT_THROW(build_periodic_graph(s, GraphSettings{}), DegenerateCellError);
}

TEST(PeriodicGraphBuilderTest, IndependentOfThreadCount) {
  const Structure s = fixtures::carbon_slab(3, 5.0, 15.0, 3);

  GraphSettings one;
  one.n_threads = 1;
  GraphSettings many;
  many.n_threads = 4;

  const BondGraph a = build_periodic_graph(s, one);
  const BondGraph b = build_periodic_graph(s, many);
  EXPECT_EQ(a.edges(), b.edges());
  ASSERT_EQ(a.bonds().size(), b.bonds().size());
  for (std::size_t k = 0; k < a.bonds().size(); ++k) {
    EXPECT_EQ(a.bonds()[k].i, b.bonds()[k].i);
    EXPECT_EQ(a.bonds()[k].j, b.bonds()[k].j);
    EXPECT_EQ(a.bonds()[k].translation, b.bonds()[k].translation);
  }
}

TEST(BondGraphTest, NodeIdsAndPlacement) {
  // Two-atom molecule split by the x boundary of a 10 A cell.
  Structure s = fixtures::cubic(10.0);
  s.add_atom(6, {9.6, 5, 5});
  s.add_atom(6, {0.6, 5, 5});
  const BondGraph g = build_periodic_graph(s, GraphSettings{});

  const auto u = g.find_node(1, Image{1, 0, 0});
  ASSERT_TRUE(u.has_value());
  const PeriodicNode n = g.node(*u);
  EXPECT_EQ(n.atom, 1u);
  EXPECT_EQ(n.image, (Image{1, 0, 0}));

  const auto placement = g.placement_images({true, true});
  EXPECT_EQ(placement[0], (Image{0, 0, 0}));
  EXPECT_EQ(placement[1], (Image{1, 0, 0}));
  const auto placed = g.placed_positions(placement);
  EXPECT_NEAR(placed[1][0] - placed[0][0], 1.0, 1e-12);
}
