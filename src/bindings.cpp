#include <emscripten/bind.h>
#include "Board.hpp"
#include "GameSession.hpp"
#include "ModuleCatalogue.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace emscripten;

namespace {

Color color_from_int(int value) {
    if (value < 0 || value >= static_cast<int>(TOKEN_COLORS.size())) {
        throw std::invalid_argument("color must be 0..3, got " + std::to_string(value));
    }
    return static_cast<Color>(value);
}

BoardConfig config_from_flat(const std::vector<int>& flat) {
    if (flat.size() != 8) throw std::invalid_argument("board config needs 8 ints (module, face) x 4");
    BoardConfig config{};
    for (std::size_t i = 0; i < 4; ++i) config[i] = {flat[2 * i], flat[2 * i + 1]};
    return config;
}

// [cor, x, y]*
std::vector<Token> tokens_from_flat(const std::vector<int>& flat) {
    if (flat.size() % 3 != 0) throw std::invalid_argument("tokens need [color, x, y] triples");
    std::vector<Token> tokens;
    for (std::size_t i = 0; i < flat.size(); i += 3) {
        tokens.push_back({color_from_int(flat[i]), Pos{flat[i + 1], flat[i + 2]}});
    }
    return tokens;
}

} // namespace

/**
 * Fachada para a UI JS: tudo em inteiros e arrays "flat".
 * Os objetivos são referidos pelo índice em Board::get_goals().
 */
class WasmSession {
public:
    WasmSession(const std::vector<int>& config, const std::vector<int>& tokens)
        : session(Board(config_from_flat(config), standard_catalogue()), tokens_from_flat(tokens)) {}

    // false + lastError() se a colocação inicial for inválida.
    bool start() {
        try {
            session.start();
            last_error.clear();
            return true;
        } catch (const PlacementError& e) {
            last_error = e.what();
            return false;
        }
    }
    void reset() { session.reset(); last.reset(); }
    void finish() { session.finish(); }

    std::vector<int> get_walls() const { return session.get_board().get_flat_walls(); }
    std::vector<int> get_refractors() const { return session.get_board().get_flat_refractors(); }
    std::vector<int> get_goals() const { return session.get_board().get_flat_goals(); }

    std::vector<int> get_tokens() const {
        std::vector<int> flat;
        for (const auto& t : session.get_tokens()) {
            flat.push_back(index_of(t.color));
            flat.push_back(t.pos.x);
            flat.push_back(t.pos.y);
        }
        return flat;
    }

    std::string goal_id(int index) const { return goal_at(index).id; }

    // [índice do objetivo, máscara de cores elegíveis]*
    std::vector<int> available_goals() const {
        std::vector<int> flat;
        const auto& goals = session.get_board().get_goals();
        for (const auto& option : session.available_goals()) {
            for (std::size_t i = 0; i < goals.size(); ++i) {
                if (goals[i].id != option.goal.id) continue;
                int mask = 0;
                for (Color c : option.eligible) mask |= 1 << index_of(c);
                flat.push_back(static_cast<int>(i));
                flat.push_back(mask);
            }
        }
        return flat;
    }

    // Devolve o SearchStatus como inteiro; o resultado fica guardado.
    int solve(int goal_index, int color) {
        const Goal& g = goal_at(goal_index);
        const Color c = color_from_int(color);
        last = session.solve(g.id, c);
        last_goal = g.id;
        last_color = c;
        return static_cast<int>(last->status);
    }

    // [cor, direção, de.x, de.y, para.x, para.y]*
    std::vector<int> last_actions() const {
        std::vector<int> flat;
        if (!last) return flat;
        for (const auto& a : last->actions) {
            flat.insert(flat.end(), {index_of(a.color), index_of(a.direction),
                                     a.from.x, a.from.y, a.to.x, a.to.y});
        }
        return flat;
    }

    // [ação, início.x, início.y, direção, fim.x, fim.y]*
    std::vector<int> last_segments() const {
        std::vector<int> flat;
        if (!last) return flat;
        for (std::size_t i = 0; i < last->actions.size(); ++i) {
            for (const auto& s : last->actions[i].segments) {
                flat.insert(flat.end(), {static_cast<int>(i), s.start.x, s.start.y,
                                         index_of(s.direction), s.end.x, s.end.y});
            }
        }
        return flat;
    }

    int last_states_explored() const {
        return last ? static_cast<int>(last->states_explored) : 0;
    }

    bool execute_last() {
        if (!last || !last->ok()) return false;
        session.execute_round(last_goal, last_color, *last);
        last.reset();
        return true;
    }

    int rounds() const { return session.statistics().rounds; }
    int total_actions() const { return session.statistics().total_actions; }
    std::string last_error_message() const { return last_error; }
    void set_debug_level(int lvl) { session.set_debug_level(lvl); }

private:
    GameSession session;
    std::optional<SearchResult> last;
    std::string last_goal;
    Color last_color = Color::Red;
    std::string last_error;

    const Goal& goal_at(int index) const {
        const auto& goals = session.get_board().get_goals();
        if (index < 0 || static_cast<std::size_t>(index) >= goals.size()) {
            throw std::out_of_range("goal index out of range");
        }
        return goals[static_cast<std::size_t>(index)];
    }
};

EMSCRIPTEN_BINDINGS(std_types) {
    register_vector<int>("VectorInt");
}

EMSCRIPTEN_BINDINGS(prism_module) {
    enum_<SearchStatus>("SearchStatus")
        .value("Solved", SearchStatus::Solved)
        .value("TargetNotFound", SearchStatus::TargetNotFound)
        .value("InvalidGoal", SearchStatus::InvalidGoal)
        .value("InvalidTokens", SearchStatus::InvalidTokens)
        .value("SearchSpaceExhausted", SearchStatus::SearchSpaceExhausted)
        .value("NoPath", SearchStatus::NoPath);

    class_<WasmSession>("GameSession")
        .constructor<const std::vector<int>&, const std::vector<int>&>()
        .function("start", &WasmSession::start)
        .function("reset", &WasmSession::reset)
        .function("finish", &WasmSession::finish)
        .function("getFlatWalls", &WasmSession::get_walls)
        .function("getFlatRefractors", &WasmSession::get_refractors)
        .function("getFlatGoals", &WasmSession::get_goals)
        .function("getFlatTokens", &WasmSession::get_tokens)
        .function("getGoalId", &WasmSession::goal_id)
        .function("getAvailableGoals", &WasmSession::available_goals)
        .function("solve", &WasmSession::solve)
        .function("getLastActions", &WasmSession::last_actions)
        .function("getLastSegments", &WasmSession::last_segments)
        .function("getLastStatesExplored", &WasmSession::last_states_explored)
        .function("executeLast", &WasmSession::execute_last)
        .function("getRounds", &WasmSession::rounds)
        .function("getTotalActions", &WasmSession::total_actions)
        .function("getLastError", &WasmSession::last_error_message)
        .function("setDebugLevel", &WasmSession::set_debug_level);
}
