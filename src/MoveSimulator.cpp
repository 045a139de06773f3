#include "MoveSimulator.hpp"
#include <bitset>

namespace {
    constexpr std::size_t VISITED_SLOTS = BOARD_SIZE * BOARD_SIZE * 4;

    inline std::size_t visited_index(Pos p, Direction d) {
        return (static_cast<std::size_t>(p.y) * BOARD_SIZE + static_cast<std::size_t>(p.x)) * 4 +
               static_cast<std::size_t>(index_of(d));
    }
}

bool MoveSimulator::is_blocked(Pos from, Direction dir, std::size_t self,
                               const Pos* positions, std::size_t count) const {
    const Pos next = step(from, dir);
    if (!board.is_inside(next.x, next.y)) return true;
    if (board.is_in_dead_zone(next.x, next.y)) return true;
    if (board.cell_unchecked(from).has_wall(side_for(dir))) return true;
    for (std::size_t i = 0; i < count; ++i) {
        if (i != self && positions[i] == next) return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// run():
// - Ciclo iterativo; cada refração fecha o segmento atual e abre outro na
//   própria célula do refrator.
// - 'visited' guarda os pares (posição, direção) de início de cada segmento.
// ----------------------------------------------------------------------------
Pos MoveSimulator::run(Color color, std::size_t self, Direction dir,
                       const Pos* positions, std::size_t count,
                       std::vector<Segment>* segments, bool* cycle) const {
    const Pos start = positions[self];
    Pos pos = start;
    Pos seg_start = start;
    Direction seg_dir = dir;

    std::bitset<VISITED_SLOTS> visited;
    visited.set(visited_index(start, dir));

    while (!is_blocked(pos, dir, self, positions, count)) {
        pos = step(pos, dir);

        const auto& refractor = board.cell_unchecked(pos).get_refractor();
        if (!refractor || refractor->is_transparent_to(color)) continue;

        const Direction new_dir = refractor->refract(dir, color);
        if (segments) segments->push_back({seg_start, seg_dir, pos});
        seg_start = pos;
        seg_dir = new_dir;

        if (visited.test(visited_index(pos, new_dir))) {
            if (cycle) *cycle = true;
            return pos;
        }
        visited.set(visited_index(pos, new_dir));
        dir = new_dir;
    }

    if (segments && pos != seg_start) {
        segments->push_back({seg_start, seg_dir, pos});
    }
    return pos;
}

MoveResult MoveSimulator::simulate(Color color, std::size_t self, Direction dir,
                                   const Pos* positions, std::size_t count) const {
    MoveResult result;
    result.start = positions[self];
    result.final_pos = run(color, self, dir, positions, count,
                           &result.segments, &result.cycle_detected);
    result.moved = result.final_pos != result.start;
    return result;
}

MoveResult MoveSimulator::simulate(const std::vector<Token>& tokens, std::size_t index,
                                   Direction dir) const {
    std::vector<Pos> positions;
    positions.reserve(tokens.size());
    for (const auto& t : tokens) positions.push_back(t.pos);
    return simulate(tokens[index].color, index, dir, positions.data(), positions.size());
}

Pos MoveSimulator::slide(Color color, std::size_t self, Direction dir,
                         const Pos* positions, std::size_t count) const {
    return run(color, self, dir, positions, count, nullptr, nullptr);
}
