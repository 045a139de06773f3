// ============================================================================
// Board.cpp — Implementação do tabuleiro composto
// ----------------------------------------------------------------------------
// Ordem de construção:
//   1) grelha 16x16 com paredes apenas nos quatro limites exteriores;
//   2) validação: quatro módulos resolvidos com quatro cores distintas
//      (uma cor repetida é a única forma de ter menos de quatro);
//   3) por quadrante: rotação do módulo, cópia com offset, fusão de paredes
//      (exceto as que coincidem com o limite exterior global) espelhadas no
//      vizinho, inclusive através das costuras;
//   4) selagem da zona morta central (x,y em {7,8});
//   5) índice de objetivos (ids repetidos entre módulos são erro fatal).
// ============================================================================

#include "Board.hpp"
#include "LogMsgs.hpp"
#include "Module.hpp"
#include <set>
#include <string>

Board::Board() {
    create_empty_cells();
    seal_dead_zone();
    collect_goals();
}

Board::Board(const BoardConfig& cfg, const ModuleCatalogue& catalogue, int debug_level)
    : config(cfg), composite(true), debug_level(debug_level) {
    create_empty_cells();
    validate_config(catalogue);
    place_modules(catalogue);
    seal_dead_zone();
    collect_goals();

    if (debug_level >= 1) {
        LogMsgs::Board::log_board_built(quadrant_colors, get_stats().wall_count,
                                        get_stats().refractor_count,
                                        static_cast<int>(goals.size()));
    }
}

Board build_board(const BoardConfig& config, const ModuleCatalogue& catalogue) {
    return Board(config, catalogue);
}

// ============================================================================
// MONTAGEM
// ============================================================================

void Board::create_empty_cells() {
    for (int y = 0; y < BOARD_SIZE; ++y) {
        for (int x = 0; x < BOARD_SIZE; ++x) {
            cells[y][x] = Cell({x, y});
        }
    }
    // Paredes dos limites exteriores
    for (int i = 0; i < BOARD_SIZE; ++i) {
        cells[0][i].set_wall(Side::Top, true);
        cells[BOARD_SIZE - 1][i].set_wall(Side::Bottom, true);
        cells[i][0].set_wall(Side::Left, true);
        cells[i][BOARD_SIZE - 1].set_wall(Side::Right, true);
    }
}

void Board::validate_config(const ModuleCatalogue& catalogue) {
    std::set<Color> colors;

    for (Quadrant q : ALL_QUADRANTS) {
        const QuadrantConfig& qc = config[index_of(q)];
        const Module* module = catalogue.find(qc.module_id);
        if (module == nullptr) {
            throw BoardConstructionError(BoardConstructionError::Kind::UnknownModule,
                "Module " + std::to_string(qc.module_id) + " not found (" + to_string(q) + ")");
        }
        if (qc.face_id < 0 || qc.face_id >= FACES_PER_MODULE) {
            throw BoardConstructionError(BoardConstructionError::Kind::UnknownFace,
                "Face " + std::to_string(qc.face_id) + " not found in module " +
                std::to_string(qc.module_id));
        }
        if (colors.count(module->get_color()) != 0) {
            throw BoardConstructionError(BoardConstructionError::Kind::DuplicateColor,
                std::string("Duplicate color: ") + ::to_string(module->get_color()));
        }
        colors.insert(module->get_color());
        quadrant_colors[index_of(q)] = module->get_color();
    }
}

bool Board::is_outer_boundary(Pos p, Side side) const {
    return (side == Side::Top && p.y == 0) ||
           (side == Side::Bottom && p.y == BOARD_SIZE - 1) ||
           (side == Side::Left && p.x == 0) ||
           (side == Side::Right && p.x == BOARD_SIZE - 1);
}

void Board::set_wall_symmetric(Pos p, Side side) {
    cells[p.y][p.x].set_wall(side, true);
    const Pos adj = step(p, side);
    if (is_inside(adj.x, adj.y)) {
        cells[adj.y][adj.x].set_wall(opposite(side), true);
    }
}

void Board::place_modules(const ModuleCatalogue& catalogue) {
    for (Quadrant q : ALL_QUADRANTS) {
        const QuadrantConfig& qc = config[index_of(q)];
        const Module& module = *catalogue.find(qc.module_id);
        const Pos offset = QUADRANT_OFFSETS[index_of(q)];

        const Rotation angle = module.rotation_for(q);
        const ModuleGrid local = module.rotate(qc.face_id, angle);

        int walls_written = 0;
        int walls_skipped = 0;
        int refractors = 0;
        int goals_copied = 0;

        for (int y = 0; y < MODULE_SIZE; ++y) {
            for (int x = 0; x < MODULE_SIZE; ++x) {
                const Cell& src = local[y][x];
                const Pos gp{offset.x + x, offset.y + y};

                // Só se ignora o limite exterior real; as costuras mantêm-se.
                for (Side side : ALL_SIDES) {
                    if (!src.has_wall(side)) continue;
                    if (is_outer_boundary(gp, side)) {
                        ++walls_skipped;
                        continue;
                    }
                    set_wall_symmetric(gp, side);
                    ++walls_written;
                }

                Cell& dst = cells[gp.y][gp.x];
                if (const auto& r = src.get_refractor()) {
                    dst.set_refractor(*r);
                    ++refractors;
                }
                if (const auto& g = src.get_goal()) {
                    dst.set_goal(*g);
                    ++goals_copied;
                }
            }
        }

        if (debug_level >= 2) {
            LogMsgs::Board::log_module_placed(q, module.get_id(), qc.face_id, degrees(angle),
                                              walls_written, walls_skipped,
                                              refractors, goals_copied);
        }
    }
}

void Board::seal_dead_zone() {
    for (int y = DEAD_ZONE_MIN; y <= DEAD_ZONE_MAX; ++y) {
        for (int x = DEAD_ZONE_MIN; x <= DEAD_ZONE_MAX; ++x) {
            cells[y][x].seal();
        }
    }
    // Paredes viradas para dentro nas células vizinhas
    for (int i = DEAD_ZONE_MIN; i <= DEAD_ZONE_MAX; ++i) {
        cells[i][DEAD_ZONE_MIN - 1].set_wall(Side::Right, true);
        cells[i][DEAD_ZONE_MAX + 1].set_wall(Side::Left, true);
        cells[DEAD_ZONE_MIN - 1][i].set_wall(Side::Bottom, true);
        cells[DEAD_ZONE_MAX + 1][i].set_wall(Side::Top, true);
    }
}

void Board::collect_goals() {
    goals.clear();
    std::set<std::string> ids;
    for (int y = 0; y < BOARD_SIZE; ++y) {
        for (int x = 0; x < BOARD_SIZE; ++x) {
            if (const auto& g = cells[y][x].get_goal()) {
                // ids únicos no tabuleiro inteiro, não só dentro de cada módulo
                if (!ids.insert(g->id).second) {
                    throw BoardConstructionError(BoardConstructionError::Kind::DuplicateGoalId,
                        "Duplicate goal id '" + g->id + "' at " + ::to_string(g->pos));
                }
                goals.push_back(*g);
            }
        }
    }
}

// ============================================================================
// CONSULTAS
// ============================================================================

const Cell& Board::get_cell(int x, int y) const {
    if (!is_inside(x, y)) {
        throw std::out_of_range("Cell outside board: " + ::to_string(Pos{x, y}));
    }
    return cells[y][x];
}

const Goal* Board::find_goal(const std::string& id) const {
    for (const auto& g : goals) {
        if (g.id == id) return &g;
    }
    return nullptr;
}

std::vector<Goal> Board::goals_for_color(Color color) const {
    std::vector<Goal> out;
    for (const auto& g : goals) {
        if (g.accepts(color)) out.push_back(g);
    }
    return out;
}

Board::Stats Board::get_stats() const {
    Stats s;
    int wall_sides = 0;
    for (int y = 0; y < BOARD_SIZE; ++y) {
        for (int x = 0; x < BOARD_SIZE; ++x) {
            const Cell& c = cells[y][x];
            for (Side side : ALL_SIDES) {
                if (!c.has_wall(side)) continue;
                // Paredes exteriores não têm par; as interiores contam a dobrar.
                wall_sides += is_outer_boundary({x, y}, side) ? 2 : 1;
            }
            if (c.has_refractor()) ++s.refractor_count;
        }
    }
    s.wall_count = wall_sides / 2;
    s.goal_count = static_cast<int>(goals.size());
    return s;
}

// ============================================================================
// HELPERS DE EDIÇÃO
// ============================================================================

void Board::require_editable(Pos p) const {
    if (!is_inside(p.x, p.y)) {
        throw std::invalid_argument("Position outside board: " + ::to_string(p));
    }
    if (is_in_dead_zone(p.x, p.y)) {
        throw std::invalid_argument("Position inside dead zone: " + ::to_string(p));
    }
}

void Board::add_wall(Pos p, Side side) {
    require_editable(p);
    set_wall_symmetric(p, side);
}

void Board::place_refractor(const Refractor& r) {
    require_editable(r.pos);
    if (!is_concrete(r.color)) {
        throw std::invalid_argument("Refractor color must be concrete");
    }
    cells[r.pos.y][r.pos.x].set_refractor(r);
}

void Board::place_goal(const Goal& g) {
    require_editable(g.pos);
    if (g.id.empty()) {
        throw std::invalid_argument("Goal without id at " + ::to_string(g.pos));
    }
    const Goal* existing = find_goal(g.id);
    if (existing != nullptr && existing->pos != g.pos) {
        throw std::invalid_argument("Duplicate goal id: " + g.id);
    }
    cells[g.pos.y][g.pos.x].set_goal(g);
    collect_goals();
}

// ============================================================================
// GETTERS WASM/UI
// ============================================================================

std::vector<int> Board::get_flat_walls() const {
    std::vector<int> flat;
    flat.reserve(static_cast<size_t>(BOARD_SIZE * BOARD_SIZE));
    for (const auto& row : cells) {
        for (const auto& c : row) flat.push_back(c.wall_mask());
    }
    return flat;
}

std::vector<int> Board::get_flat_refractors() const {
    std::vector<int> flat;
    for (const auto& row : cells) {
        for (const auto& c : row) {
            if (const auto& r = c.get_refractor()) {
                flat.push_back(r->pos.x);
                flat.push_back(r->pos.y);
                flat.push_back(static_cast<int>(r->orientation));
                flat.push_back(index_of(r->color));
            }
        }
    }
    return flat;
}

std::vector<int> Board::get_flat_goals() const {
    std::vector<int> flat;
    flat.reserve(goals.size() * 4);
    for (const auto& g : goals) {
        flat.push_back(g.pos.x);
        flat.push_back(g.pos.y);
        flat.push_back(static_cast<int>(g.shape));
        flat.push_back(index_of(g.color));
    }
    return flat;
}
