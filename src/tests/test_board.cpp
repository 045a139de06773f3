#include <gtest/gtest.h>
#include "Board.hpp"
#include "ModuleCatalogue.hpp"
#include <algorithm>
#include <array>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Helper: todas as configurações com módulos de cores distintas, limitadas
// para manter o teste rápido (24 permutações x 2 variantes + 16 faces).
static std::vector<BoardConfig> sample_configs(const ModuleCatalogue& cat) {
  std::vector<BoardConfig> out;
  std::array<Color, 4> colors = TOKEN_COLORS;
  std::sort(colors.begin(), colors.end());
  do {
    for (int variant = 0; variant < 2; ++variant) {
      BoardConfig cfg{};
      for (std::size_t q = 0; q < 4; ++q) {
        cfg[q] = {cat.ids_for_color(colors[q])[variant], variant};
      }
      out.push_back(cfg);
    }
  } while (std::next_permutation(colors.begin(), colors.end()));

  for (int mask = 0; mask < 16; ++mask) {
    BoardConfig cfg{{{0, 0}, {2, 0}, {4, 0}, {6, 0}}};
    for (std::size_t q = 0; q < 4; ++q) cfg[q].face_id = (mask >> q) & 1;
    out.push_back(cfg);
  }
  return out;
}

static void expect_outer_walls(const Board& b) {
  for (int i = 0; i < BOARD_SIZE; ++i) {
    EXPECT_TRUE(b.get_cell(i, 0).has_wall(Side::Top)) << i;
    EXPECT_TRUE(b.get_cell(i, BOARD_SIZE - 1).has_wall(Side::Bottom)) << i;
    EXPECT_TRUE(b.get_cell(0, i).has_wall(Side::Left)) << i;
    EXPECT_TRUE(b.get_cell(BOARD_SIZE - 1, i).has_wall(Side::Right)) << i;
  }
}

static void expect_sealed_dead_zone(const Board& b) {
  for (int y = DEAD_ZONE_MIN; y <= DEAD_ZONE_MAX; ++y) {
    for (int x = DEAD_ZONE_MIN; x <= DEAD_ZONE_MAX; ++x) {
      const Cell& c = b.get_cell(x, y);
      EXPECT_EQ(c.wall_count(), 4) << to_string(Pos{x, y});
      EXPECT_TRUE(c.is_empty()) << to_string(Pos{x, y});
    }
  }
  for (int i = DEAD_ZONE_MIN; i <= DEAD_ZONE_MAX; ++i) {
    EXPECT_TRUE(b.get_cell(DEAD_ZONE_MIN - 1, i).has_wall(Side::Right));
    EXPECT_TRUE(b.get_cell(DEAD_ZONE_MAX + 1, i).has_wall(Side::Left));
    EXPECT_TRUE(b.get_cell(i, DEAD_ZONE_MIN - 1).has_wall(Side::Bottom));
    EXPECT_TRUE(b.get_cell(i, DEAD_ZONE_MAX + 1).has_wall(Side::Top));
  }
}

static void expect_symmetric_walls(const Board& b) {
  for (int y = 0; y < BOARD_SIZE; ++y) {
    for (int x = 0; x < BOARD_SIZE; ++x) {
      for (Side s : ALL_SIDES) {
        const Pos n = step(Pos{x, y}, s);
        if (!b.is_inside(n.x, n.y)) continue;
        EXPECT_EQ(b.get_cell(x, y).has_wall(s), b.get_cell(n).has_wall(opposite(s)))
            << to_string(Pos{x, y}) << " side " << to_string(s);
      }
    }
  }
}

TEST(OpenBoard, HasOuterWallsAndSealedDeadZoneOnly) {
  Board b;
  expect_outer_walls(b);
  expect_sealed_dead_zone(b);
  expect_symmetric_walls(b);
  EXPECT_FALSE(b.is_composite());
  EXPECT_TRUE(b.get_goals().empty());

  // 64 exteriores + 4 internas da zona morta + 8 à volta dela
  EXPECT_EQ(b.get_stats().wall_count, 76);
  EXPECT_FALSE(b.get_cell(3, 3).has_wall(Side::Right));
}

TEST(OpenBoard, PositionQueries) {
  Board b;
  EXPECT_TRUE(b.is_valid_position(0, 0));
  EXPECT_TRUE(b.is_valid_position(15, 15));
  EXPECT_FALSE(b.is_valid_position(16, 3));
  EXPECT_FALSE(b.is_valid_position(-1, 0));
  EXPECT_FALSE(b.is_valid_position(7, 8));
  EXPECT_TRUE(b.is_valid_position(6, 8));
  EXPECT_THROW(b.get_cell(16, 0), std::out_of_range);
}

TEST(OpenBoard, EditHelpersKeepSymmetryAndRejectDeadZone) {
  Board b;
  b.add_wall({3, 3}, Side::Right);
  EXPECT_TRUE(b.get_cell(3, 3).has_wall(Side::Right));
  EXPECT_TRUE(b.get_cell(4, 3).has_wall(Side::Left));

  EXPECT_THROW(b.add_wall({7, 7}, Side::Top), std::invalid_argument);
  EXPECT_THROW(b.place_refractor({{8, 8}, RefractorOrientation::Slash, Color::Red}),
               std::invalid_argument);
  EXPECT_THROW(b.place_refractor({{2, 2}, RefractorOrientation::Slash, Color::Wildcard}),
               std::invalid_argument);

  b.place_goal({{5, 5}, Shape::Circle, Color::Red, "g1"});
  EXPECT_EQ(b.get_goals().size(), 1u);
  EXPECT_THROW(b.place_goal({{6, 5}, Shape::Square, Color::Red, "g1"}), std::invalid_argument);
}

TEST(CompositeBoard, InvariantsHoldForEveryCatalogueConfiguration) {
  const ModuleCatalogue cat = standard_catalogue();
  for (const auto& cfg : sample_configs(cat)) {
    const Board b(cfg, cat);
    SCOPED_TRACE(std::to_string(cfg[0].module_id) + "," + std::to_string(cfg[1].module_id) + "," +
                 std::to_string(cfg[2].module_id) + "," + std::to_string(cfg[3].module_id));
    expect_outer_walls(b);
    expect_sealed_dead_zone(b);
    expect_symmetric_walls(b);

    // 4 objetivos por face, ids únicos, nenhum na zona morta
    EXPECT_EQ(b.get_goals().size(), 16u);
    std::set<std::string> ids;
    for (const auto& g : b.get_goals()) {
      EXPECT_TRUE(ids.insert(g.id).second) << g.id;
      EXPECT_TRUE(b.is_valid_position(g.pos)) << g.id;
      ASSERT_TRUE(b.get_cell(g.pos).has_goal());
      EXPECT_EQ(b.get_cell(g.pos).get_goal()->id, g.id);
    }
    EXPECT_EQ(b.get_stats().refractor_count, 8);
  }
}

TEST(CompositeBoard, TopLeftModuleKeepsItsOrientation) {
  // módulo 0 tem o gap em BottomRight: no quadrante TL não roda
  const ModuleCatalogue cat = standard_catalogue();
  const Board b(BoardConfig{{{0, 0}, {2, 0}, {4, 0}, {6, 0}}}, cat);

  const Cell& goal = b.get_cell(1, 2);
  ASSERT_TRUE(goal.has_goal());
  EXPECT_EQ(goal.get_goal()->id, "m0f0-circle");
  EXPECT_EQ(goal.get_goal()->color, Color::Red);
  EXPECT_TRUE(goal.has_wall(Side::Top));
  EXPECT_TRUE(goal.has_wall(Side::Left));
  EXPECT_TRUE(b.get_cell(1, 1).has_wall(Side::Bottom));
  EXPECT_TRUE(b.get_cell(0, 2).has_wall(Side::Right));

  const Cell& prism = b.get_cell(3, 3);
  ASSERT_TRUE(prism.has_refractor());
  EXPECT_EQ(prism.get_refractor()->orientation, RefractorOrientation::Backslash);
  EXPECT_EQ(prism.get_refractor()->color, Color::Blue);

  EXPECT_EQ(b.get_quadrant_colors()[0], Color::Red);
  EXPECT_EQ(b.get_quadrant_colors()[3], Color::Green);
}

TEST(CompositeBoard, TopRightModuleIsRotatedHalfTurn) {
  // módulo 2 (gap TopRight) no quadrante TR precisa de 180º
  const ModuleCatalogue cat = standard_catalogue();
  const Board b(BoardConfig{{{0, 0}, {2, 0}, {4, 0}, {6, 0}}}, cat);

  // objetivo local (1,1) -> (6,6) rodado -> (14,6) no tabuleiro
  const Cell& goal = b.get_cell(14, 6);
  ASSERT_TRUE(goal.has_goal());
  EXPECT_EQ(goal.get_goal()->id, "m2f0-circle");
  // paredes {T, L} passam a {B, R}
  EXPECT_TRUE(goal.has_wall(Side::Bottom));
  EXPECT_TRUE(goal.has_wall(Side::Right));
}

TEST(CompositeBoard, SeamWallsAreMirroredAcrossQuadrants) {
  // módulo 1 (gap TopLeft) em TR roda 270º; as costuras mantêm a simetria
  const ModuleCatalogue cat = standard_catalogue();
  const Board b(BoardConfig{{{4, 0}, {1, 0}, {2, 0}, {6, 0}}}, cat);
  expect_symmetric_walls(b);
  expect_sealed_dead_zone(b);
}

TEST(CompositeBoard, ConstructionErrorsCarryTheirKind) {
  const ModuleCatalogue cat = standard_catalogue();

  try {
    Board b(BoardConfig{{{99, 0}, {2, 0}, {4, 0}, {6, 0}}}, cat);
    FAIL() << "expected UnknownModule";
  } catch (const BoardConstructionError& e) {
    EXPECT_EQ(e.kind(), BoardConstructionError::Kind::UnknownModule);
  }

  try {
    Board b(BoardConfig{{{0, 2}, {2, 0}, {4, 0}, {6, 0}}}, cat);
    FAIL() << "expected UnknownFace";
  } catch (const BoardConstructionError& e) {
    EXPECT_EQ(e.kind(), BoardConstructionError::Kind::UnknownFace);
  }

  try {
    Board b(BoardConfig{{{0, 0}, {1, 0}, {4, 0}, {6, 0}}}, cat);
    FAIL() << "expected DuplicateColor";
  } catch (const BoardConstructionError& e) {
    EXPECT_EQ(e.kind(), BoardConstructionError::Kind::DuplicateColor);
  }

  EXPECT_THROW(build_board(BoardConfig{{{0, 0}, {2, 0}, {4, 0}, {3, 1}}}, cat),
               BoardConstructionError);
}

// Quatro módulos (um por cor) com um único objetivo, todos com o mesmo id.
static ModuleCatalogue catalogue_with_goal_ids(const std::array<std::string, 4>& ids) {
  ModuleCatalogue cat;
  for (std::size_t i = 0; i < 4; ++i) {
    Face f;
    f.goals.push_back({{1, 1}, Shape::Circle, TOKEN_COLORS[i], ids[i]});
    cat.add(Module(static_cast<int>(i), TOKEN_COLORS[i], Corner::BottomRight, {f, Face{}}));
  }
  return cat;
}

TEST(CompositeBoard, GoalIdRepeatedAcrossModulesIsRejected) {
  const BoardConfig cfg{{{0, 0}, {1, 0}, {2, 0}, {3, 0}}};

  try {
    Board b(cfg, catalogue_with_goal_ids({"dup", "dup", "dup", "dup"}));
    FAIL() << "expected DuplicateGoalId";
  } catch (const BoardConstructionError& e) {
    EXPECT_EQ(e.kind(), BoardConstructionError::Kind::DuplicateGoalId);
  }

  // basta um par repetido
  EXPECT_THROW(Board(cfg, catalogue_with_goal_ids({"a", "b", "c", "a"})),
               BoardConstructionError);

  const Board ok(cfg, catalogue_with_goal_ids({"a", "b", "c", "d"}));
  ASSERT_EQ(ok.get_goals().size(), 4u);
  for (const auto& g : ok.get_goals()) {
    const Goal* found = ok.find_goal(g.id);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->pos, g.pos);
  }
}

TEST(CompositeBoard, FlatGettersHaveExpectedShapes) {
  const ModuleCatalogue cat = standard_catalogue();
  const Board b = build_board(BoardConfig{{{1, 1}, {3, 1}, {5, 1}, {7, 1}}}, cat);
  EXPECT_EQ(b.get_flat_walls().size(), 256u);
  EXPECT_EQ(b.get_flat_refractors().size(), 8u * 4u);
  EXPECT_EQ(b.get_flat_goals().size(), 16u * 4u);
}
