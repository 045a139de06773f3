// ============================================================================
// Module.cpp — Materialização e rotação das faces de um módulo
// ----------------------------------------------------------------------------
// - As paredes vêm apenas dos dados de autor; cada parede registada é
//   espelhada no vizinho (lado oposto) para manter a simetria local.
// - A rotação transforma individualmente cada parede, refrator e objetivo
//   e volta a inseri-los na posição rodada.
// ============================================================================

#include "Module.hpp"
#include "Rotator.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
    bool in_module(Pos p) {
        return p.x >= 0 && p.x < MODULE_SIZE && p.y >= 0 && p.y < MODULE_SIZE;
    }

    int cell_index(Pos p) { return p.y * MODULE_SIZE + p.x; }
}

Module::Module(int id, Color color, Corner gap_corner, std::array<Face, FACES_PER_MODULE> faces)
    : id(id), color(color), gap_corner(gap_corner), faces(std::move(faces)) {
    validate();
}

void Module::validate() const {
    const std::string where = "module " + std::to_string(id);
    if (!is_concrete(color)) {
        throw std::invalid_argument(where + ": module color must be concrete");
    }
    for (int f = 0; f < FACES_PER_MODULE; ++f) {
        const Face& face = faces[f];
        std::set<int> refractor_cells;
        std::set<int> goal_cells;
        std::set<std::string> goal_ids;
        for (const auto& w : face.walls) {
            if (!in_module(w.pos)) {
                throw std::invalid_argument(where + ": wall outside module at " + to_string(w.pos));
            }
        }
        for (const auto& r : face.refractors) {
            if (!in_module(r.pos)) {
                throw std::invalid_argument(where + ": refractor outside module at " + to_string(r.pos));
            }
            if (!is_concrete(r.color)) {
                throw std::invalid_argument(where + ": refractor color must be concrete");
            }
            if (!refractor_cells.insert(cell_index(r.pos)).second) {
                throw std::invalid_argument(where + ": two refractors at " + to_string(r.pos));
            }
        }
        for (const auto& g : face.goals) {
            if (!in_module(g.pos)) {
                throw std::invalid_argument(where + ": goal outside module at " + to_string(g.pos));
            }
            if (g.id.empty()) {
                throw std::invalid_argument(where + ": goal without id at " + to_string(g.pos));
            }
            if (!goal_cells.insert(cell_index(g.pos)).second) {
                throw std::invalid_argument(where + ": two goals at " + to_string(g.pos));
            }
            if (!goal_ids.insert(g.id).second) {
                throw std::invalid_argument(where + ": duplicate goal id '" + g.id + "'");
            }
        }
    }
}

const Face& Module::get_face(int face_id) const {
    if (face_id < 0 || face_id >= FACES_PER_MODULE) {
        throw std::out_of_range("Face " + std::to_string(face_id) +
                                " not found in module " + std::to_string(id));
    }
    return faces[face_id];
}

ModuleGrid Module::empty_grid() {
    ModuleGrid grid;
    for (int y = 0; y < MODULE_SIZE; ++y) {
        for (int x = 0; x < MODULE_SIZE; ++x) {
            grid[y][x] = Cell({x, y});
        }
    }
    return grid;
}

ModuleGrid Module::materialize_face(int face_id) const {
    const Face& face = get_face(face_id);
    ModuleGrid grid = empty_grid();

    for (const auto& w : face.walls) {
        for (Side side : w.sides) {
            grid[w.pos.y][w.pos.x].set_wall(side, true);
            // espelha no vizinho se este ainda estiver dentro do módulo
            const Pos adj = step(w.pos, side);
            if (in_module(adj)) {
                grid[adj.y][adj.x].set_wall(opposite(side), true);
            }
        }
    }

    for (const auto& r : face.refractors) {
        grid[r.pos.y][r.pos.x].set_refractor(r);
    }
    for (const auto& g : face.goals) {
        grid[g.pos.y][g.pos.x].set_goal(g);
    }
    return grid;
}

ModuleGrid Module::rotate_grid(const ModuleGrid& grid, Rotation angle) {
    if (angle == Rotation::R0) return grid;

    ModuleGrid rotated = empty_grid();
    for (int y = 0; y < MODULE_SIZE; ++y) {
        for (int x = 0; x < MODULE_SIZE; ++x) {
            const Cell& old_cell = grid[y][x];
            const Pos np = Rotator::rotate_point({x, y}, angle, MODULE_SIZE);
            Cell& new_cell = rotated[np.y][np.x];

            for (Side side : ALL_SIDES) {
                if (old_cell.has_wall(side)) {
                    new_cell.set_wall(Rotator::rotate_side(side, angle), true);
                }
            }

            if (const auto& r = old_cell.get_refractor()) {
                Refractor nr = *r;
                nr.orientation = Rotator::rotate_orientation(r->orientation, angle);
                new_cell.set_refractor(nr);
            }
            if (const auto& g = old_cell.get_goal()) {
                new_cell.set_goal(*g);
            }
        }
    }
    return rotated;
}

ModuleGrid Module::rotate(int face_id, Rotation angle) const {
    return rotate_grid(materialize_face(face_id), angle);
}

Rotation Module::rotation_for(Quadrant quadrant) const {
    return Rotator::rotation_between(gap_corner, QUADRANT_GAP_CORNERS[index_of(quadrant)]);
}
