// ============================================================================
// PathFinder.hpp — Pesquisa em largura sobre estados conjuntos das peças
// ----------------------------------------------------------------------------
// - Estado = tuplo das posições de todas as peças (ordenadas por cor).
// - Transições: cada peça x cada direção (up, down, left, right) via
//   MoveSimulator; ações sem deslocamento são descartadas.
// - Vitória: a peça alvo pára exatamente no objetivo com nº de ações >= 2;
//   com 1 ação a transição é descartada (nem sequer é enfileirada).
// - Deduplicação por chave inteira (8 bits (x,y) por peça num uint32_t).
// - Limite de estados retirados da fila -> SearchSpaceExhausted.
// - Nunca lança exceções para o chamador e nunca altera as peças recebidas.
// ============================================================================
#ifndef PATH_FINDER_HPP
#define PATH_FINDER_HPP

#pragma once
#include "Board.hpp"
#include "Constants.hpp"
#include "MoveSimulator.hpp"
#include "Token.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class SearchStatus {
    Solved,
    TargetNotFound,
    InvalidGoal,
    InvalidTokens,
    SearchSpaceExhausted,
    NoPath
};

const char* to_string(SearchStatus s);

struct Action {
    Color color = Color::Red;
    Direction direction = Direction::Up;
    Pos from;
    Pos to;
    std::vector<Segment> segments;
};

struct SearchResult {
    SearchStatus status = SearchStatus::NoPath;
    int action_count = 0;
    std::vector<Action> actions;
    std::vector<Token> final_tokens;   // posições depois de aplicar a solução
    std::uint64_t states_explored = 0;
    double elapsed_ms = 0.0;
    std::string message;

    bool ok() const { return status == SearchStatus::Solved; }
};

struct SearchOptions {
    std::uint64_t max_states = 1000000;
    int min_actions = 2;    // regra do jogo: não há vitória com 1 ação
    int debug_level = 0;    // 0 silencioso .. 3 traço de expansões
};

class PathFinder {
public:
    explicit PathFinder(const Board& board, SearchOptions options = {});

    /**
     * Solução com o menor nº de ações que leva a peça 'target' até 'goal'.
     * Os estados de falha trazem sempre states_explored e elapsed_ms.
     */
    SearchResult find_path(const std::vector<Token>& tokens, Color target, Pos goal) const;

    // Ações válidas (com deslocamento) de uma peça a partir das posições dadas.
    std::vector<Action> possible_moves(const std::vector<Token>& tokens, Color color) const;

    const SearchOptions& get_options() const { return options; }
    void set_debug_level(int lvl) { options.debug_level = lvl; }
    void set_max_states(std::uint64_t n) { options.max_states = n; }

private:
    const Board& board;
    MoveSimulator simulator;
    SearchOptions options;

    struct Node {
        std::array<Pos, MAX_TOKENS> pos;
        std::int32_t parent;
        std::uint8_t token;
        Direction dir;
        std::uint16_t depth;
    };

    static std::uint32_t pack_key(const std::array<Pos, MAX_TOKENS>& pos, std::size_t count);

    SearchResult bfs(const std::vector<Token>& sorted, std::size_t target_index, Pos goal) const;

    std::vector<Action> rebuild_actions(const std::vector<Node>& nodes, std::int32_t last,
                                        const std::vector<Token>& sorted) const;
};

// Ponto de entrada funcional.
SearchResult find_path(const Board& board, const std::vector<Token>& tokens,
                       Color target, Pos goal, const SearchOptions& options = {});

#endif // PATH_FINDER_HPP
