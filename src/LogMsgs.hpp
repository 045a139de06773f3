#ifndef LOGMSGS_HPP
#define LOGMSGS_HPP

#include "Constants.hpp"
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

struct SearchResult;
struct RoundRecord;

namespace LogMsgs {
// Stream configurável (por defeito std::cout)
void set_stream(std::ostream& os);
std::ostream& out();

namespace Board {
void log_module_placed(Quadrant q, int module_id, int face_id, int angle_deg,
                       int walls_written, int walls_skipped,
                       int refractors, int goals);
void log_board_built(const std::array<Color, 4>& colors, int walls,
                     int refractors, int goals);
} // namespace Board

namespace Search {
// Helpers específicos da pesquisa em largura
void log_start(Color target, Pos from, Pos goal, std::size_t tokens,
               std::uint64_t max_states);
void log_depth_reached(int depth, std::uint64_t explored, std::size_t frontier);
void log_expansion(int depth, Color color, Direction dir, Pos from, Pos to);
void log_rejected_single_action(Color color, Direction dir, Pos goal);
void log_result(const SearchResult& result);
} // namespace Search

namespace Session {
void log_round(const RoundRecord& round);
} // namespace Session

} // namespace LogMsgs

#endif
