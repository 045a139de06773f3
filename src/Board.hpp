// ============================================================================
// Board.hpp — Interface do tabuleiro composto 16x16
// ----------------------------------------------------------------------------
// expõe a API principal do motor C++ que é compilado para WebAssembly e
// consumido pela UI (renderização, editores, codificação de configurações).
//
// - Quatro módulos 8x8 (um por quadrante: TL, TR, BL, BR) rodados para que
//   o canto do gap de cada um fique junto ao centro.
// - Paredes simétricas: uma parede num lado implica a parede oposta no
//   vizinho, inclusive nas costuras entre quadrantes.
// - Zona morta central 2x2 (x,y em {7,8}) sempre selada e vazia.
// - Depois de construído o tabuleiro é só de leitura e pode ser partilhado
//   por várias pesquisas em simultâneo.
// ============================================================================
#ifndef BOARD_HPP
#define BOARD_HPP

#pragma once
#include "Cell.hpp"
#include "Constants.hpp"
#include "ModuleCatalogue.hpp"
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

struct QuadrantConfig {
    int module_id = 0;
    int face_id = 0;
};

// Ordem fixa: top-left, top-right, bottom-left, bottom-right.
using BoardConfig = std::array<QuadrantConfig, 4>;

/**
 * Erro fatal de construção do tabuleiro (referências de módulo/face por
 * resolver, regra das quatro cores distintas violada ou ids de objetivo
 * repetidos entre módulos).
 * Com quatro quadrantes, "menos de 4 cores distintas" implica uma cor
 * repetida, pelo que DuplicateColor cobre os dois casos.
 */
class BoardConstructionError : public std::runtime_error {
public:
    enum class Kind { UnknownModule, UnknownFace, DuplicateColor, DuplicateGoalId };

    BoardConstructionError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * @class Board
 * Grelha 16x16 de células montada a partir de quatro módulos.
 *
 * Responsabilidades:
 * - Montar os módulos (rotação, cópia, fusão simétrica de paredes).
 * - Selar a zona morta e indexar os objetivos.
 * - Responder a consultas de posição (limites, zona morta, conteúdo).
 *
 * Integração WASM/JS:
 * - get_flat_* devolvem arrays "flat" (1D) para facilitar o consumo na UI.
 */
class Board {

public:

    struct Stats {
        int wall_count = 0;       // cada parede partilhada conta uma vez
        int refractor_count = 0;
        int goal_count = 0;
    };

    /**
     * Tabuleiro aberto: apenas paredes exteriores e zona morta selada.
     * Útil para puzzles sintéticos (ver add_wall/place_refractor/place_goal).
     */
    Board();

    /**
     * Monta o tabuleiro a partir da configuração e do catálogo.
     * Lança BoardConstructionError se a configuração for inválida.
     */
    Board(const BoardConfig& config, const ModuleCatalogue& catalogue, int debug_level = 0);

    bool is_inside(int x, int y) const {
        return x >= 0 && x < BOARD_SIZE && y >= 0 && y < BOARD_SIZE;
    }
    bool is_in_dead_zone(int x, int y) const {
        return x >= DEAD_ZONE_MIN && x <= DEAD_ZONE_MAX &&
               y >= DEAD_ZONE_MIN && y <= DEAD_ZONE_MAX;
    }
    // Dentro do tabuleiro e fora da zona morta.
    bool is_valid_position(int x, int y) const {
        return is_inside(x, y) && !is_in_dead_zone(x, y);
    }
    bool is_valid_position(Pos p) const { return is_valid_position(p.x, p.y); }

    // Lança std::out_of_range fora do tabuleiro.
    const Cell& get_cell(int x, int y) const;
    const Cell& get_cell(Pos p) const { return get_cell(p.x, p.y); }
    // Acesso sem verificação (o chamador garante is_inside).
    const Cell& cell_unchecked(Pos p) const { return cells[p.y][p.x]; }

    const std::vector<Goal>& get_goals() const { return goals; }
    const Goal* find_goal(const std::string& id) const;
    std::vector<Goal> goals_for_color(Color color) const;

    bool is_composite() const { return composite; }
    const BoardConfig& get_config() const { return config; }
    const std::array<Color, 4>& get_quadrant_colors() const { return quadrant_colors; }
    Stats get_stats() const;

    // // Helpers de edição (puzzles sintéticos / testes)
    // ------------------------------------------------------------------------
    // Só devem ser usados antes de o tabuleiro ser partilhado.
    // Lançam std::invalid_argument fora do tabuleiro ou na zona morta.

    // Coloca a parede e o seu espelho no vizinho.
    void add_wall(Pos p, Side side);
    void place_refractor(const Refractor& r);
    void place_goal(const Goal& g);

    //getters para WASM/JS
    std::vector<int> get_flat_walls() const;       // 256 bitmasks (bit = Side)
    std::vector<int> get_flat_refractors() const;  // [x, y, orientação, cor]*
    std::vector<int> get_flat_goals() const;       // [x, y, forma, cor]*

private:
    std::array<std::array<Cell, BOARD_SIZE>, BOARD_SIZE> cells; // [y][x]
    std::vector<Goal> goals;
    BoardConfig config{};
    std::array<Color, 4> quadrant_colors{};
    bool composite = false;
    int debug_level = 0;

    void create_empty_cells();
    void validate_config(const ModuleCatalogue& catalogue);
    void place_modules(const ModuleCatalogue& catalogue);
    void seal_dead_zone();
    void collect_goals();

    void set_wall_symmetric(Pos p, Side side);
    bool is_outer_boundary(Pos p, Side side) const;
    void require_editable(Pos p) const;
};

// Equivalente funcional ao construtor composto.
Board build_board(const BoardConfig& config, const ModuleCatalogue& catalogue);

#endif // BOARD_HPP
