// ============================================================================
// StandardModules.cpp — Conjunto standard de módulos (dados de autor)
// ----------------------------------------------------------------------------
// - Oito módulos 8x8, dois por cor, cada um com duas faces.
// - Cada face tem quatro objetivos (um por forma), cada um com uma parede
//   em "L", dois refratores e dois pequenos segmentos de parede.
// - Coordenadas no espaço local não rodado do módulo; o canto do gap fica
//   sempre vazio (é ocupado pela zona morta depois da montagem).
// - Ids dos objetivos: "m<id>f<face>-<forma>" (únicos no tabuleiro, porque
//   os quatro módulos de um tabuleiro são sempre distintos).
// ============================================================================

#include "ModuleCatalogue.hpp"
#include <initializer_list>
#include <string>

namespace {

constexpr Side T = Side::Top;
constexpr Side R = Side::Right;
constexpr Side B = Side::Bottom;
constexpr Side L = Side::Left;

struct GoalSpec {
    int x, y;
    Shape shape;
    Color color;
    std::initializer_list<Side> walls;
};

struct PrismSpec {
    int x, y;
    char orientation;
    Color color;
};

struct StubSpec {
    int x, y;
    Side side;
};

Face make_face(int module_id, int face_id,
               std::initializer_list<GoalSpec> goals,
               std::initializer_list<PrismSpec> prisms,
               std::initializer_list<StubSpec> stubs) {
    Face face;
    const std::string prefix = "m" + std::to_string(module_id) + "f" + std::to_string(face_id) + "-";
    for (const auto& g : goals) {
        face.goals.push_back(Goal{{g.x, g.y}, g.shape, g.color, prefix + to_string(g.shape)});
        face.walls.push_back(WallRecord{{g.x, g.y}, std::vector<Side>(g.walls)});
    }
    for (const auto& p : prisms) {
        const auto orientation = parse_orientation(p.orientation);
        face.refractors.push_back(Refractor{{p.x, p.y},
                                            orientation.value_or(RefractorOrientation::Backslash),
                                            p.color});
    }
    for (const auto& s : stubs) {
        face.walls.push_back(WallRecord{{s.x, s.y}, {s.side}});
    }
    return face;
}

constexpr Shape CIR = Shape::Circle;
constexpr Shape TRI = Shape::Triangle;
constexpr Shape SQR = Shape::Square;
constexpr Shape HEX = Shape::Hexagon;

constexpr Color RED = Color::Red;
constexpr Color YEL = Color::Yellow;
constexpr Color BLU = Color::Blue;
constexpr Color GRN = Color::Green;
constexpr Color ANY = Color::Wildcard;

} // namespace

ModuleCatalogue standard_catalogue() {
    ModuleCatalogue cat;

    // ---- red ---------------------------------------------------------------
    cat.add(Module(0, RED, Corner::BottomRight, {
        make_face(0, 0,
                  {{1, 2, CIR, RED, {T, L}}, {5, 1, TRI, YEL, {R, B}},
                   {2, 5, SQR, BLU, {B, R}}, {6, 4, HEX, GRN, {T, L}}},
                  {{3, 3, '\\', BLU}, {4, 6, '/', YEL}},
                  {{3, 0, R}, {0, 5, B}}),
        make_face(0, 1,
                  {{2, 1, CIR, GRN, {L, B}}, {6, 2, TRI, RED, {T, R}},
                   {1, 6, SQR, YEL, {T, R}}, {4, 4, HEX, BLU, {B, L}}},
                  {{5, 5, '\\', GRN}, {2, 3, '/', BLU}},
                  {{4, 0, R}, {0, 2, B}})
    }));

    cat.add(Module(1, RED, Corner::TopLeft, {
        make_face(1, 0,
                  {{5, 2, CIR, BLU, {T, R}}, {2, 3, TRI, RED, {L, B}},
                   {6, 6, SQR, GRN, {B, L}}, {3, 6, HEX, YEL, {T, R}}},
                  {{4, 4, '/', GRN}, {1, 5, '\\', YEL}},
                  {{7, 4, B}, {4, 7, R}}),
        make_face(1, 1,
                  {{3, 1, CIR, YEL, {R, B}}, {6, 3, TRI, BLU, {L, T}},
                   {1, 4, SQR, RED, {T, L}}, {5, 6, HEX, ANY, {B, R}}},
                  {{2, 6, '/', YEL}, {4, 2, '\\', GRN}},
                  {{7, 2, B}, {2, 7, R}})
    }));

    // ---- yellow ------------------------------------------------------------
    cat.add(Module(2, YEL, Corner::TopRight, {
        make_face(2, 0,
                  {{1, 1, CIR, YEL, {T, L}}, {4, 2, TRI, GRN, {R, B}},
                   {2, 6, SQR, RED, {L, T}}, {5, 5, HEX, BLU, {B, R}}},
                  {{3, 4, '\\', RED}, {6, 3, '/', GRN}},
                  {{0, 3, B}, {3, 7, R}}),
        make_face(2, 1,
                  {{2, 2, CIR, RED, {B, L}}, {5, 1, TRI, YEL, {T, R}},
                   {1, 5, SQR, GRN, {R, B}}, {4, 5, HEX, BLU, {T, L}}},
                  {{6, 5, '/', RED}, {3, 3, '\\', BLU}},
                  {{0, 4, B}, {5, 7, R}})
    }));

    cat.add(Module(3, YEL, Corner::BottomLeft, {
        make_face(3, 0,
                  {{2, 1, CIR, BLU, {L, T}}, {6, 2, TRI, YEL, {R, B}},
                   {3, 5, SQR, GRN, {T, R}}, {5, 4, HEX, RED, {B, L}}},
                  {{4, 3, '/', BLU}, {1, 4, '\\', RED}},
                  {{3, 0, R}, {7, 5, B}}),
        make_face(3, 1,
                  {{1, 2, CIR, GRN, {T, R}}, {5, 2, TRI, BLU, {L, B}},
                   {2, 4, SQR, YEL, {B, L}}, {6, 5, HEX, ANY, {T, R}}},
                  {{3, 6, '\\', GRN}, {4, 1, '/', RED}},
                  {{5, 0, R}, {7, 3, B}})
    }));

    // ---- blue --------------------------------------------------------------
    cat.add(Module(4, BLU, Corner::BottomRight, {
        make_face(4, 0,
                  {{1, 3, CIR, BLU, {L, T}}, {4, 1, TRI, RED, {B, R}},
                   {2, 6, SQR, YEL, {T, R}}, {5, 4, HEX, GRN, {B, L}}},
                  {{3, 2, '/', RED}, {6, 6, '\\', GRN}},
                  {{2, 0, R}, {0, 6, B}}),
        make_face(4, 1,
                  {{3, 1, CIR, GRN, {R, T}}, {6, 3, TRI, BLU, {L, B}},
                   {1, 5, SQR, RED, {B, R}}, {4, 5, HEX, YEL, {T, L}}},
                  {{2, 3, '\\', YEL}, {5, 6, '/', RED}},
                  {{5, 0, R}, {0, 3, B}})
    }));

    cat.add(Module(5, BLU, Corner::TopLeft, {
        make_face(5, 0,
                  {{4, 2, CIR, RED, {T, L}}, {6, 5, TRI, GRN, {R, B}},
                   {2, 4, SQR, BLU, {L, B}}, {5, 6, HEX, YEL, {T, R}}},
                  {{3, 5, '/', YEL}, {1, 2, '\\', RED}},
                  {{7, 3, B}, {3, 7, R}}),
        make_face(5, 1,
                  {{2, 2, CIR, YEL, {B, R}}, {5, 3, TRI, RED, {T, L}},
                   {3, 6, SQR, GRN, {L, T}}, {6, 6, HEX, BLU, {B, R}}},
                  {{4, 4, '\\', YEL}, {1, 5, '/', GRN}},
                  {{7, 5, B}, {4, 7, R}})
    }));

    // ---- green -------------------------------------------------------------
    cat.add(Module(6, GRN, Corner::TopRight, {
        make_face(6, 0,
                  {{1, 2, CIR, GRN, {L, B}}, {5, 2, TRI, YEL, {T, R}},
                   {2, 5, SQR, BLU, {R, B}}, {4, 6, HEX, RED, {T, L}}},
                  {{3, 3, '/', RED}, {5, 5, '\\', YEL}},
                  {{0, 5, B}, {2, 7, R}}),
        make_face(6, 1,
                  {{2, 1, CIR, BLU, {T, R}}, {4, 3, TRI, GRN, {B, L}},
                   {1, 6, SQR, RED, {T, L}}, {6, 5, HEX, ANY, {B, R}}},
                  {{3, 5, '\\', BLU}, {5, 2, '/', YEL}},
                  {{0, 3, B}, {4, 7, R}})
    }));

    cat.add(Module(7, GRN, Corner::BottomLeft, {
        make_face(7, 0,
                  {{3, 2, CIR, YEL, {B, L}}, {6, 1, TRI, RED, {T, L}},
                   {1, 4, SQR, GRN, {T, R}}, {5, 5, HEX, BLU, {R, B}}},
                  {{4, 4, '/', BLU}, {2, 6, '\\', RED}},
                  {{4, 0, R}, {7, 3, B}}),
        make_face(7, 1,
                  {{2, 3, CIR, RED, {R, T}}, {5, 1, TRI, GRN, {B, R}},
                   {4, 5, SQR, BLU, {L, B}}, {1, 5, HEX, YEL, {T, L}}},
                  {{3, 1, '\\', YEL}, {6, 4, '/', BLU}},
                  {{6, 0, R}, {7, 5, B}})
    }));

    return cat;
}
