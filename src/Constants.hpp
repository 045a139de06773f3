// ============================================================================
// Constants.hpp — Constantes e enumerações partilhadas do motor
// ----------------------------------------------------------------------------
// - Tabuleiro composto 16x16 montado a partir de quatro módulos 8x8.
// - Coordenadas: (x, y) com origem (0,0) no canto superior esquerdo;
//   x cresce para a direita, y cresce para baixo.
// - Zona morta central: células com x,y em {7,8} (sempre selada).
// - As tabelas aqui definidas são imutáveis (constexpr); não existe estado
//   global mutável.
// ============================================================================
#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

constexpr int MODULE_SIZE = 8;
constexpr int BOARD_SIZE = 16;
constexpr int DEAD_ZONE_MIN = 7;
constexpr int DEAD_ZONE_MAX = 8;
constexpr std::size_t MAX_TOKENS = 4;

// Posição de uma célula.
struct Pos {
    int x = 0;
    int y = 0;

    bool operator==(const Pos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Pos& o) const { return !(*this == o); }
};

// Red..Green são as cores concretas (peças, refratores, módulos).
// Wildcard só é válido em objetivos ("rainbow" nos dados de autor).
enum class Color : std::uint8_t { Red, Yellow, Blue, Green, Wildcard };

// A ordem é cíclica no sentido horário: a rotação de 90º avança um passo.
enum class Side : std::uint8_t { Top, Right, Bottom, Left };
enum class Direction : std::uint8_t { Up, Right, Down, Left };

// '\' liga canto superior esquerdo ao inferior direito; '/' o inverso.
enum class RefractorOrientation : std::uint8_t { Backslash, Slash };

enum class Shape : std::uint8_t { Circle, Triangle, Square, Hexagon };

// Ordem fixa da configuração: TL, TR, BL, BR.
enum class Quadrant : std::uint8_t { TopLeft, TopRight, BottomLeft, BottomRight };

// Cantos numerados no sentido horário (usado no cálculo da rotação).
enum class Corner : std::uint8_t { TopLeft = 0, TopRight = 1, BottomRight = 2, BottomLeft = 3 };

// Ângulos canónicos; compõem-se por soma módulo 360.
enum class Rotation : std::uint8_t { R0 = 0, R90 = 1, R180 = 2, R270 = 3 };

// ----------------------------------------------------------------------------
// Tabelas imutáveis
// ----------------------------------------------------------------------------

inline constexpr std::array<Color, 4> TOKEN_COLORS = {
    Color::Red, Color::Yellow, Color::Blue, Color::Green
};

inline constexpr std::array<Side, 4> ALL_SIDES = {
    Side::Top, Side::Right, Side::Bottom, Side::Left
};

inline constexpr std::array<Quadrant, 4> ALL_QUADRANTS = {
    Quadrant::TopLeft, Quadrant::TopRight, Quadrant::BottomLeft, Quadrant::BottomRight
};

// Ordem pela qual a pesquisa tenta as direções.
inline constexpr std::array<Direction, 4> SEARCH_DIRECTIONS = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right
};

// Deslocamentos (dx, dy) indexados por Direction.
inline constexpr std::array<std::array<int, 2>, 4> DIRECTION_DELTAS = {{
    {{0, -1}}, {{1, 0}}, {{0, 1}}, {{-1, 0}}
}};

// Offset de cada quadrante no tabuleiro, indexado por Quadrant.
inline constexpr std::array<Pos, 4> QUADRANT_OFFSETS = {{
    {0, 0}, {MODULE_SIZE, 0}, {0, MODULE_SIZE}, {MODULE_SIZE, MODULE_SIZE}
}};

// Canto de cada quadrante que fica encostado à zona morta.
inline constexpr std::array<Corner, 4> QUADRANT_GAP_CORNERS = {
    Corner::BottomRight, Corner::BottomLeft, Corner::TopRight, Corner::TopLeft
};

// Tabela de refração: [orientação][direção de entrada] -> direção de saída.
//   '\' : right<->down, left<->up
//   '/' : right<->up,   left<->down
inline constexpr std::array<std::array<Direction, 4>, 2> REFRACTION_TABLE = {{
    // Backslash: Up->Left, Right->Down, Down->Right, Left->Up
    {{Direction::Left, Direction::Down, Direction::Right, Direction::Up}},
    // Slash:     Up->Right, Right->Up, Down->Left, Left->Down
    {{Direction::Right, Direction::Up, Direction::Left, Direction::Down}}
}};

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

inline constexpr int index_of(Side s) { return static_cast<int>(s); }
inline constexpr int index_of(Direction d) { return static_cast<int>(d); }
inline constexpr int index_of(Color c) { return static_cast<int>(c); }
inline constexpr int index_of(Quadrant q) { return static_cast<int>(q); }

inline constexpr Side opposite(Side s) {
    return static_cast<Side>((index_of(s) + 2) % 4);
}

inline constexpr Direction opposite(Direction d) {
    return static_cast<Direction>((index_of(d) + 2) % 4);
}

// A parede que bloqueia um movimento na direção d está no lado homónimo.
inline constexpr Side side_for(Direction d) {
    return static_cast<Side>(index_of(d));
}

inline constexpr Pos step(Pos p, Direction d) {
    return {p.x + DIRECTION_DELTAS[index_of(d)][0], p.y + DIRECTION_DELTAS[index_of(d)][1]};
}

inline constexpr Pos step(Pos p, Side s) {
    return step(p, static_cast<Direction>(index_of(s)));
}

// Falso para Wildcard e para valores fora do enum (ex.: ints vindos da UI).
inline constexpr bool is_concrete(Color c) { return index_of(c) < index_of(Color::Wildcard); }

Rotation compose(Rotation a, Rotation b);
Rotation inverse(Rotation a);
int degrees(Rotation a);
// Lança std::invalid_argument para ângulos fora de {0, 90, 180, 270}.
Rotation rotation_from_degrees(int deg);

// Nomes legíveis (logs, CLI, bindings)
const char* to_string(Color c);
const char* to_string(Side s);
const char* to_string(Direction d);
const char* to_string(Shape s);
const char* to_string(Quadrant q);
char to_char(RefractorOrientation o);
std::string to_string(Pos p);

std::optional<Color> parse_color(const std::string& s);
std::optional<Direction> parse_direction(const std::string& s);
std::optional<Side> parse_side(const std::string& s);
std::optional<Shape> parse_shape(const std::string& s);
std::optional<RefractorOrientation> parse_orientation(char c);

#endif // CONSTANTS_HPP
