#include "LogMsgs.hpp"
#include "GameSession.hpp"
#include "PathFinder.hpp"
#include <iomanip>
#include <iostream>

namespace {
    std::ostream* g_log_stream = &std::cout;
}

namespace LogMsgs {
void set_stream(std::ostream& os) { g_log_stream = &os; }
std::ostream& out() { return *g_log_stream; }

namespace Board {
void log_module_placed(Quadrant q, int module_id, int face_id, int angle_deg,
                       int walls_written, int walls_skipped,
                       int refractors, int goals) {
    out() << "[board] " << to_string(q) << " <- module " << module_id
          << " face " << face_id << " rot " << angle_deg << "deg"
          << " walls=" << walls_written;
    if (walls_skipped) out() << " (skipped " << walls_skipped << " on outer edge)";
    out() << " refractors=" << refractors << " goals=" << goals << "\n";
}

void log_board_built(const std::array<Color, 4>& colors, int walls,
                     int refractors, int goals) {
    out() << "[board] built [";
    for (std::size_t i = 0; i < colors.size(); ++i) {
        if (i) out() << ", ";
        out() << to_string(colors[i]);
    }
    out() << "] walls=" << walls << " refractors=" << refractors
          << " goals=" << goals << "\n";
}
} // namespace Board

namespace Search {
void log_start(Color target, Pos from, Pos goal, std::size_t tokens,
               std::uint64_t max_states) {
    out() << "[search] " << to_string(target) << " " << to_string(from)
          << " -> " << to_string(goal) << " tokens=" << tokens
          << " max_states=" << max_states << "\n";
}

void log_depth_reached(int depth, std::uint64_t explored, std::size_t frontier) {
    out() << "├── depth " << depth << " explored=" << explored
          << " frontier=" << frontier << "\n";
}

void log_expansion(int depth, Color color, Direction dir, Pos from, Pos to) {
    out() << "│ " << std::string(static_cast<std::size_t>(depth) * 2, ' ')
          << to_string(color) << " " << to_string(dir) << ": "
          << to_string(from) << " -> " << to_string(to) << "\n";
}

void log_rejected_single_action(Color color, Direction dir, Pos goal) {
    out() << "│ rejected single action " << to_string(color) << " "
          << to_string(dir) << " onto " << to_string(goal) << "\n";
}

void log_result(const SearchResult& result) {
    auto& o = out();
    o << "└── " << to_string(result.status);
    if (result.ok()) o << " in " << result.action_count << " action(s)";
    o << " explored=" << result.states_explored
      << " time=" << std::fixed << std::setprecision(2) << result.elapsed_ms << "ms";
    if (!result.ok() && !result.message.empty()) o << " (" << result.message << ")";
    o << std::defaultfloat << "\n";
}
} // namespace Search

namespace Session {
void log_round(const RoundRecord& round) {
    out() << "****[round " << round.round_number << "] " << to_string(round.color)
          << " " << to_string(round.start) << " -> " << round.goal.id
          << " " << to_string(round.end) << " in " << round.actions << " action(s)\n";
}
} // namespace Session

} // namespace LogMsgs
