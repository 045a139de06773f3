#include "GameSession.hpp"
#include "LogMsgs.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

GameSession::GameSession(Board board, std::vector<Token> tokens, SearchOptions options)
    : board(std::move(board)),
      initial_tokens(tokens),
      tokens(std::move(tokens)),
      options(options) {}

void GameSession::start() {
    if (started) throw std::logic_error("session already started");
    PlacementReport report = validate_start(board, tokens);
    if (!report.ok()) throw PlacementError(std::move(report));
    started = true;
    finished = false;
}

void GameSession::finish() {
    require_active("finish");
    finished = true;
}

void GameSession::reset() {
    tokens = initial_tokens;
    rounds.clear();
    used_goals.clear();
    started = false;
    finished = false;
}

void GameSession::require_active(const char* what) const {
    if (!started) throw std::logic_error(std::string(what) + ": session not started");
    if (finished) throw std::logic_error(std::string(what) + ": session already finished");
}

const Goal& GameSession::require_goal(const std::string& goal_id) const {
    const Goal* goal = board.find_goal(goal_id);
    if (!goal) throw std::invalid_argument("unknown goal '" + goal_id + "'");
    if (is_used(goal_id)) throw std::invalid_argument("goal '" + goal_id + "' already used");
    return *goal;
}

bool GameSession::is_used(const std::string& goal_id) const {
    return std::find(used_goals.begin(), used_goals.end(), goal_id) != used_goals.end();
}

bool GameSession::is_occupied(Pos p) const {
    for (const auto& t : tokens) {
        if (t.pos == p) return true;
    }
    return false;
}

std::vector<Color> GameSession::eligible_colors(const Goal& goal) const {
    std::vector<Color> colors;
    for (Color c : TOKEN_COLORS) {
        if (goal.accepts(c) && find_token(tokens, c)) colors.push_back(c);
    }
    return colors;
}

std::vector<GoalOption> GameSession::available_goals() const {
    std::vector<GoalOption> options_out;
    for (const auto& g : board.get_goals()) {
        if (is_used(g.id) || is_occupied(g.pos)) continue;
        options_out.push_back({g, eligible_colors(g)});
    }

    // Wildcard primeiro, depois red, yellow, blue, green; dentro da cor, por forma.
    auto color_rank = [](Color c) { return c == Color::Wildcard ? -1 : index_of(c); };
    std::stable_sort(options_out.begin(), options_out.end(),
                     [&](const GoalOption& a, const GoalOption& b) {
                         const int ca = color_rank(a.goal.color);
                         const int cb = color_rank(b.goal.color);
                         if (ca != cb) return ca < cb;
                         return static_cast<int>(a.goal.shape) < static_cast<int>(b.goal.shape);
                     });
    return options_out;
}

std::vector<Color> GameSession::select_goal(const std::string& goal_id) const {
    require_active("select_goal");
    const Goal& goal = require_goal(goal_id);
    if (is_occupied(goal.pos)) {
        throw std::invalid_argument("goal '" + goal_id + "' is occupied by a token");
    }
    std::vector<Color> colors = eligible_colors(goal);
    if (colors.empty()) {
        throw std::invalid_argument("goal '" + goal_id + "' has no eligible token");
    }
    return colors;
}

SearchResult GameSession::solve(const std::string& goal_id, Color color) const {
    const std::vector<Color> colors = select_goal(goal_id);
    if (std::find(colors.begin(), colors.end(), color) == colors.end()) {
        throw std::invalid_argument(std::string(to_string(color)) +
                                    " token cannot take goal '" + goal_id + "'");
    }
    const Goal* goal = board.find_goal(goal_id);
    return PathFinder(board, options).find_path(tokens, color, goal->pos);
}

const RoundRecord& GameSession::execute_round(const std::string& goal_id, Color color,
                                              const SearchResult& result) {
    if (!result.ok()) {
        throw std::invalid_argument(std::string("cannot execute a round from status ") +
                                    to_string(result.status));
    }
    const std::vector<Color> colors = select_goal(goal_id);
    if (std::find(colors.begin(), colors.end(), color) == colors.end()) {
        throw std::invalid_argument(std::string(to_string(color)) +
                                    " token cannot take goal '" + goal_id + "'");
    }
    const Goal& goal = *board.find_goal(goal_id);
    if (result.final_tokens.size() != tokens.size()) {
        throw std::invalid_argument("result does not match the session tokens");
    }
    const Token* final_target = find_token(result.final_tokens, color);
    if (!final_target || final_target->pos != goal.pos) {
        throw std::invalid_argument("result does not place the " +
                                    std::string(to_string(color)) + " token on the goal");
    }

    RoundRecord round;
    round.round_number = static_cast<int>(rounds.size()) + 1;
    round.goal = goal;
    round.color = color;
    round.start = find_token(tokens, color)->pos;
    round.end = goal.pos;
    round.actions = result.action_count;
    round.path = result.actions;

    for (auto& t : tokens) {
        const Token* moved = find_token(result.final_tokens, t.color);
        if (moved) t.pos = moved->pos;
    }
    used_goals.push_back(goal_id);
    rounds.push_back(std::move(round));

    if (options.debug_level >= 1) LogMsgs::Session::log_round(rounds.back());
    return rounds.back();
}

SessionStats GameSession::statistics() const {
    SessionStats s;
    s.rounds = static_cast<int>(rounds.size());
    for (const auto& r : rounds) {
        s.total_actions += r.actions;
        s.rounds_per_color[static_cast<std::size_t>(index_of(r.color))]++;
        s.visited_goals.push_back(r.goal.id);
    }
    if (s.rounds > 0) s.average_actions = static_cast<double>(s.total_actions) / s.rounds;
    return s;
}
