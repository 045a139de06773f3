#include <gtest/gtest.h>
#include "Board.hpp"
#include "MoveSimulator.hpp"
#include "LogMsgs.hpp"
#include "PathFinder.hpp"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

// Volta a aplicar as ações da solução e devolve as posições finais.
static std::vector<Token> replay(const Board& b, std::vector<Token> tokens,
                                 const std::vector<Action>& actions) {
  MoveSimulator sim(b);
  for (const auto& a : actions) {
    std::size_t idx = tokens.size();
    for (std::size_t i = 0; i < tokens.size(); ++i) {
      if (tokens[i].color == a.color) idx = i;
    }
    EXPECT_LT(idx, tokens.size());
    if (idx == tokens.size()) break;
    EXPECT_EQ(tokens[idx].pos, a.from);
    MoveResult r = sim.simulate(tokens, idx, a.direction);
    EXPECT_TRUE(r.moved);
    EXPECT_EQ(r.final_pos, a.to);
    EXPECT_EQ(r.segments, a.segments);
    tokens[idx].pos = r.final_pos;
  }
  return tokens;
}

// Pesquisa exaustiva: existe sequência de exatamente 'remaining' ações que
// termina com o alvo a parar no objetivo sem lá ter estado antes?
static bool brute_reach(const MoveSimulator& sim, const std::vector<Token>& tokens,
                        std::size_t target, Pos goal, int remaining) {
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    for (Direction d : SEARCH_DIRECTIONS) {
      MoveResult r = sim.simulate(tokens, i, d);
      if (!r.moved) continue;
      std::vector<Token> next = tokens;
      next[i].pos = r.final_pos;
      const bool on_goal = next[target].pos == goal;
      if (remaining == 1) {
        if (i == target && on_goal) return true;
        continue;
      }
      if (on_goal) continue;
      if (brute_reach(sim, next, target, goal, remaining - 1)) return true;
    }
  }
  return false;
}

static Board puzzle_board() {
  Board b;
  b.place_refractor({{3, 3}, RefractorOrientation::Backslash, Color::Yellow});
  b.place_refractor({{10, 4}, RefractorOrientation::Slash, Color::Blue});
  b.place_refractor({{5, 12}, RefractorOrientation::Backslash, Color::Red});
  b.place_refractor({{12, 11}, RefractorOrientation::Slash, Color::Green});
  b.add_wall({6, 2}, Side::Right);
  b.add_wall({2, 9}, Side::Bottom);
  b.add_wall({11, 6}, Side::Left);
  b.add_wall({13, 13}, Side::Top);
  return b;
}

TEST(PathFinderBasics, SingleSlideIsRejectedAndThreeActionsFound) {
  Board b;
  std::vector<Token> tokens{{Color::Red, {0, 0}}};

  SearchResult r = find_path(b, tokens, Color::Red, {15, 0});
  ASSERT_EQ(r.status, SearchStatus::Solved);
  EXPECT_EQ(r.action_count, 3);
  ASSERT_EQ(r.actions.size(), 3u);
  EXPECT_EQ(r.actions[0].direction, Direction::Down);
  EXPECT_EQ(r.actions[1].direction, Direction::Right);
  EXPECT_EQ(r.actions[2].direction, Direction::Up);
  EXPECT_EQ(r.actions[2].to, (Pos{15, 0}));

  auto end = replay(b, tokens, r.actions);
  EXPECT_EQ(end, r.final_tokens);
  EXPECT_EQ(r.final_tokens[0].pos, (Pos{15, 0}));
}

TEST(PathFinderBasics, MinActionsOptionAllowsSingleSlide) {
  Board b;
  SearchOptions opts;
  opts.min_actions = 1;
  SearchResult r = find_path(b, {{Color::Red, {0, 0}}}, Color::Red, {15, 0}, opts);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.action_count, 1);
}

TEST(PathFinderBasics, OnlyOneSlideRouteMeansNoPath) {
  Board b;
  for (int x = 0; x < BOARD_SIZE; ++x) b.add_wall({x, 0}, Side::Bottom);

  SearchResult r = find_path(b, {{Color::Red, {0, 0}}}, Color::Red, {15, 0});
  EXPECT_EQ(r.status, SearchStatus::NoPath);
  EXPECT_TRUE(r.actions.empty());
  EXPECT_EQ(r.states_explored, 1u);
}

TEST(PathFinderBasics, TargetAlreadyOnGoalIsTrivialSuccess) {
  Board b;
  std::vector<Token> tokens{{Color::Blue, {4, 4}}, {Color::Red, {9, 9}}};
  SearchResult r = find_path(b, tokens, Color::Red, {9, 9});
  EXPECT_EQ(r.status, SearchStatus::Solved);
  EXPECT_EQ(r.action_count, 0);
  EXPECT_TRUE(r.actions.empty());
  EXPECT_EQ(r.final_tokens, tokens);
  EXPECT_EQ(r.states_explored, 0u);
}

TEST(PathFinderFailures, ReportedInOrder) {
  Board b;
  std::vector<Token> tokens{{Color::Red, {0, 0}}, {Color::Green, {5, 5}}};

  EXPECT_EQ(find_path(b, tokens, Color::Blue, {3, 3}).status, SearchStatus::TargetNotFound);
  EXPECT_EQ(find_path(b, tokens, Color::Wildcard, {3, 3}).status, SearchStatus::TargetNotFound);
  // alvo inexistente tem prioridade sobre objetivo inválido
  EXPECT_EQ(find_path(b, tokens, Color::Blue, {16, 3}).status, SearchStatus::TargetNotFound);

  EXPECT_EQ(find_path(b, tokens, Color::Red, {16, 3}).status, SearchStatus::InvalidGoal);
  EXPECT_EQ(find_path(b, tokens, Color::Red, {7, 7}).status, SearchStatus::InvalidGoal);
  EXPECT_EQ(find_path(b, tokens, Color::Red, {3, -1}).status, SearchStatus::InvalidGoal);

  std::vector<Token> overlapping{{Color::Red, {0, 0}}, {Color::Green, {0, 0}}};
  SearchResult bad = find_path(b, overlapping, Color::Red, {3, 3});
  EXPECT_EQ(bad.status, SearchStatus::InvalidTokens);
  EXPECT_FALSE(bad.message.empty());

  std::vector<Token> in_dead_zone{{Color::Red, {0, 0}}, {Color::Green, {8, 7}}};
  EXPECT_EQ(find_path(b, in_dead_zone, Color::Red, {3, 3}).status, SearchStatus::InvalidTokens);

  // cor fora do enum (ex.: inteiro vindo da UI)
  const Color bogus = static_cast<Color>(9);
  std::vector<Token> bad_color{{Color::Red, {0, 0}}, {bogus, {5, 5}}};
  EXPECT_EQ(find_path(b, bad_color, Color::Red, {3, 3}).status, SearchStatus::InvalidTokens);
  EXPECT_EQ(find_path(b, bad_color, bogus, {3, 3}).status, SearchStatus::TargetNotFound);
}

TEST(PathFinderFailures, StateCeilingGivesExhausted) {
  Board b;
  SearchOptions opts;
  opts.max_states = 1;
  SearchResult r = find_path(b, {{Color::Red, {0, 0}}}, Color::Red, {15, 0}, opts);
  EXPECT_EQ(r.status, SearchStatus::SearchSpaceExhausted);
  EXPECT_EQ(r.states_explored, 1u);
  EXPECT_TRUE(r.actions.empty());
}

TEST(PathFinderBasics, InputTokensAreNotModified) {
  Board b;
  const std::vector<Token> tokens{{Color::Red, {0, 0}}, {Color::Blue, {6, 6}}};
  const std::vector<Token> copy = tokens;
  find_path(b, tokens, Color::Red, {15, 0});
  EXPECT_EQ(tokens, copy);
}

TEST(PathFinderBasics, PossibleMovesSkipsNoOps) {
  Board b;
  PathFinder pf(b);
  auto moves = pf.possible_moves({{Color::Red, {0, 0}}}, Color::Red);
  ASSERT_EQ(moves.size(), 2u);
  EXPECT_EQ(moves[0].direction, Direction::Down);
  EXPECT_EQ(moves[0].to, (Pos{0, 15}));
  EXPECT_EQ(moves[1].direction, Direction::Right);
  EXPECT_EQ(moves[1].to, (Pos{15, 0}));
  EXPECT_TRUE(pf.possible_moves({{Color::Red, {0, 0}}}, Color::Blue).empty());
}

TEST(PathFinderMinimality, MatchesExhaustiveSearchOnSmallPuzzle) {
  const Board b = puzzle_board();
  MoveSimulator sim(b);
  const std::vector<Token> tokens{{Color::Red, {0, 0}}, {Color::Blue, {15, 5}}};
  const std::vector<Pos> goals{{3, 0}, {6, 2}, {10, 0}, {0, 12}, {5, 15},
                               {12, 15}, {14, 3}, {2, 9}, {11, 6}, {9, 4}};
  int compared = 0;

  for (Pos goal : goals) {
    SCOPED_TRACE(to_string(goal));
    int expected = 0;
    for (int k = 2; k <= 4 && !expected; ++k) {
      if (brute_reach(sim, tokens, 0, goal, k)) expected = k;
    }

    SearchResult r = find_path(b, tokens, Color::Red, goal);
    if (expected) {
      ASSERT_EQ(r.status, SearchStatus::Solved);
      EXPECT_EQ(r.action_count, expected);
      ++compared;
    } else if (r.ok()) {
      EXPECT_GT(r.action_count, 4);
    }
    if (r.ok()) {
      auto end = replay(b, tokens, r.actions);
      EXPECT_EQ(end[0].pos, goal);
      EXPECT_EQ(end, r.final_tokens);
    }
  }
  EXPECT_GT(compared, 0);
}

TEST(PathFinderDeterminism, TokenOrderDoesNotChangeTheAnswer) {
  const Board b = puzzle_board();
  const std::vector<Token> a{{Color::Red, {0, 0}}, {Color::Blue, {15, 5}}, {Color::Green, {9, 14}}};
  const std::vector<Token> c{{Color::Green, {9, 14}}, {Color::Red, {0, 0}}, {Color::Blue, {15, 5}}};

  SearchResult ra = find_path(b, a, Color::Red, {6, 2});
  SearchResult rc = find_path(b, c, Color::Red, {6, 2});
  ASSERT_EQ(ra.status, rc.status);
  ASSERT_EQ(ra.action_count, rc.action_count);
  for (std::size_t i = 0; i < ra.actions.size(); ++i) {
    EXPECT_EQ(ra.actions[i].color, rc.actions[i].color);
    EXPECT_EQ(ra.actions[i].direction, rc.actions[i].direction);
    EXPECT_EQ(ra.actions[i].to, rc.actions[i].to);
  }
  // final_tokens segue a ordem do chamador
  ASSERT_EQ(rc.final_tokens.size(), 3u);
  EXPECT_EQ(rc.final_tokens[0].color, Color::Green);
}

TEST(PathFinderDeterminism, ConcurrentSearchesOnSharedBoardAgree) {
  const Board b = puzzle_board();
  const std::vector<Token> tokens{{Color::Red, {0, 0}}, {Color::Blue, {15, 5}}};
  const SearchResult reference = find_path(b, tokens, Color::Red, {14, 3});

  std::vector<SearchResult> results(4);
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < results.size(); ++i) {
    workers.emplace_back([&, i] { results[i] = find_path(b, tokens, Color::Red, {14, 3}); });
  }
  for (auto& w : workers) w.join();

  for (const auto& r : results) {
    EXPECT_EQ(r.status, reference.status);
    EXPECT_EQ(r.action_count, reference.action_count);
    EXPECT_EQ(r.states_explored, reference.states_explored);
  }
}

TEST(PathFinderLogging, DebugLevelWritesToConfiguredStream) {
  Board b;
  std::ostringstream oss;
  LogMsgs::set_stream(oss);

  SearchOptions opts;
  opts.debug_level = 2;
  SearchResult r = find_path(b, {{Color::Red, {0, 0}}}, Color::Red, {15, 0}, opts);
  LogMsgs::set_stream(std::cout);

  ASSERT_TRUE(r.ok());
  const std::string log = oss.str();
  EXPECT_NE(log.find("[search] red (0,0) -> (15,0)"), std::string::npos) << log;
  EXPECT_NE(log.find("rejected single action"), std::string::npos) << log;
  EXPECT_NE(log.find("solved in 3 action(s)"), std::string::npos) << log;
}

TEST(PathFinderLogging, SilentByDefault) {
  Board b;
  std::ostringstream oss;
  LogMsgs::set_stream(oss);
  find_path(b, {{Color::Red, {0, 0}}}, Color::Red, {15, 0});
  LogMsgs::set_stream(std::cout);
  EXPECT_TRUE(oss.str().empty());
}
