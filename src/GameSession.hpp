// ============================================================================
// GameSession.hpp — Sessão de jogo (rondas sobre um tabuleiro fixo)
// ----------------------------------------------------------------------------
// Uma ronda: escolher um objetivo ainda livre, escolher a peça, pedir a
// solução ao PathFinder e aplicá-la. A sessão guarda o histórico das rondas
// e as estatísticas acumuladas.
// ============================================================================
#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#pragma once
#include "Board.hpp"
#include "PathFinder.hpp"
#include "Token.hpp"
#include <array>
#include <string>
#include <vector>

struct GoalOption {
    Goal goal;
    std::vector<Color> eligible;   // cores das peças que o objetivo aceita
};

struct RoundRecord {
    int round_number = 0;
    Goal goal;
    Color color = Color::Red;
    Pos start;
    Pos end;
    int actions = 0;
    std::vector<Action> path;
};

struct SessionStats {
    int rounds = 0;
    int total_actions = 0;
    double average_actions = 0.0;
    std::array<int, 4> rounds_per_color{};   // indexado por index_of(Color)
    std::vector<std::string> visited_goals;
};

class GameSession {
public:
    GameSession(Board board, std::vector<Token> tokens, SearchOptions options = {});

    /**
     * Valida a colocação inicial (validate_start) e abre a sessão.
     * Lança PlacementError se a colocação for inválida e std::logic_error
     * se a sessão já tiver começado.
     */
    void start();
    void finish();
    void reset();

    bool is_started() const { return started; }
    bool is_finished() const { return finished; }

    // Objetivos livres (sem peça e ainda não usados), ordenados por cor e forma.
    std::vector<GoalOption> available_goals() const;

    /**
     * Cores das peças elegíveis para o objetivo.
     * std::logic_error sem sessão ativa; std::invalid_argument se o objetivo
     * não existir, já tiver sido usado ou não tiver peças elegíveis.
     */
    std::vector<Color> select_goal(const std::string& goal_id) const;

    SearchResult solve(const std::string& goal_id, Color color) const;

    // Aplica uma solução (status Solved) e regista a ronda.
    const RoundRecord& execute_round(const std::string& goal_id, Color color,
                                     const SearchResult& result);

    const std::vector<RoundRecord>& history() const { return rounds; }
    SessionStats statistics() const;

    const Board& get_board() const { return board; }
    const std::vector<Token>& get_tokens() const { return tokens; }
    const std::vector<Token>& get_initial_tokens() const { return initial_tokens; }
    const SearchOptions& get_options() const { return options; }
    void set_debug_level(int lvl) { options.debug_level = lvl; }

private:
    Board board;
    std::vector<Token> initial_tokens;
    std::vector<Token> tokens;
    SearchOptions options;
    std::vector<RoundRecord> rounds;
    std::vector<std::string> used_goals;
    bool started = false;
    bool finished = false;

    void require_active(const char* what) const;
    const Goal& require_goal(const std::string& goal_id) const;
    bool is_used(const std::string& goal_id) const;
    bool is_occupied(Pos p) const;
    std::vector<Color> eligible_colors(const Goal& goal) const;
};

#endif // GAME_SESSION_HPP
