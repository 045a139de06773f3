// ============================================================================
// PathFinder.cpp — BFS mínima em nº de ações para levar a peça alvo ao objetivo
// ----------------------------------------------------------------------------
//
// - Peças ordenadas por cor uma única vez; a chave de estado empacota (x,y)
//   de cada peça em 8 bits (4 bits cada), até 4 peças num uint32_t.
// - Nós guardados num vetor (índice do pai + ação); o caminho é
//   reconstruído no fim voltando a simular cada ação com segmentos.
// - Ordem fixa de expansão: peça (por cor) x direção (up, down, left, right).
// - O teste de vitória acontece ao gerar o sucessor (primeiro a ser gerado
//   com profundidade mínima vence, o que torna o resultado determinístico).
// ============================================================================

#include "PathFinder.hpp"
#include "LogMsgs.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <unordered_set>
#include <utility>

const char* to_string(SearchStatus s) {
    switch (s) {
        case SearchStatus::Solved:               return "solved";
        case SearchStatus::TargetNotFound:       return "target-not-found";
        case SearchStatus::InvalidGoal:          return "invalid-goal";
        case SearchStatus::InvalidTokens:        return "invalid-tokens";
        case SearchStatus::SearchSpaceExhausted: return "search-space-exhausted";
        case SearchStatus::NoPath:               return "no-path";
    }
    return "unknown";
}

namespace {
    using Clock = std::chrono::steady_clock;

    double ms_since(Clock::time_point t0) {
        return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    }

    SearchResult failure(SearchStatus status, std::string msg, Clock::time_point t0) {
        SearchResult r;
        r.status = status;
        r.message = std::move(msg);
        r.elapsed_ms = ms_since(t0);
        return r;
    }
}

PathFinder::PathFinder(const Board& board, SearchOptions options)
    : board(board), simulator(board), options(options) {}

std::uint32_t PathFinder::pack_key(const std::array<Pos, MAX_TOKENS>& pos, std::size_t count) {
    std::uint32_t key = 0;
    for (std::size_t i = 0; i < count; ++i) {
        key = (key << 8) | (static_cast<std::uint32_t>(pos[i].x & 0xF) << 4)
                         | static_cast<std::uint32_t>(pos[i].y & 0xF);
    }
    return key;
}

std::vector<Action> PathFinder::possible_moves(const std::vector<Token>& tokens, Color color) const {
    std::vector<Action> moves;
    const auto it = std::find_if(tokens.begin(), tokens.end(),
                                 [color](const Token& t) { return t.color == color; });
    if (it == tokens.end()) return moves;

    const std::size_t self = static_cast<std::size_t>(it - tokens.begin());
    for (Direction d : SEARCH_DIRECTIONS) {
        MoveResult mr = simulator.simulate(tokens, self, d);
        if (!mr.moved) continue;
        moves.push_back({color, d, mr.start, mr.final_pos, std::move(mr.segments)});
    }
    return moves;
}

SearchResult PathFinder::find_path(const std::vector<Token>& tokens, Color target, Pos goal) const {
    const auto t0 = Clock::now();

    // Ordem das verificações: alvo -> objetivo -> peças -> sucesso trivial.
    const Token* target_token = ::find_token(tokens, target);
    if (!is_concrete(target) || !target_token) {
        return failure(SearchStatus::TargetNotFound,
                       std::string("no token of color ") + to_string(target), t0);
    }
    if (!board.is_valid_position(goal)) {
        return failure(SearchStatus::InvalidGoal,
                       "goal " + to_string(goal) + " is not a playable cell", t0);
    }
    const PlacementReport report = validate_positions(board, tokens);
    if (!report.ok()) {
        return failure(SearchStatus::InvalidTokens, report.summary(), t0);
    }
    if (target_token->pos == goal) {
        SearchResult r;
        r.status = SearchStatus::Solved;
        r.final_tokens = tokens;
        r.message = "target already on goal";
        r.elapsed_ms = ms_since(t0);
        return r;
    }

    std::vector<Token> sorted = tokens;
    std::sort(sorted.begin(), sorted.end(), [](const Token& a, const Token& b) {
        return index_of(a.color) < index_of(b.color);
    });
    std::size_t target_index = 0;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i].color == target) target_index = i;
    }

    if (options.debug_level >= 1) {
        LogMsgs::Search::log_start(target, target_token->pos, goal, tokens.size(), options.max_states);
    }

    SearchResult result = bfs(sorted, target_index, goal);
    result.elapsed_ms = ms_since(t0);

    if (result.ok()) {
        // Devolve as posições finais pela ordem original do chamador.
        std::vector<Token> final_tokens = tokens;
        for (auto& t : final_tokens) {
            for (const auto& a : result.actions) {
                if (a.color == t.color) t.pos = a.to;
            }
        }
        result.final_tokens = std::move(final_tokens);
    }

    if (options.debug_level >= 1) LogMsgs::Search::log_result(result);
    return result;
}

// ----------------------------------------------------------------------------
// bfs():
// - 'explored' conta os nós retirados da fila; ao atingir max_states antes
//   de retirar o seguinte, a pesquisa termina como SearchSpaceExhausted.
// - Transições de 1 ação que terminam no objetivo são descartadas por
//   completo (o estado não é marcado como visitado nem enfileirado).
// ----------------------------------------------------------------------------
SearchResult PathFinder::bfs(const std::vector<Token>& sorted, std::size_t target_index, Pos goal) const {
    const std::size_t count = sorted.size();
    const int min_actions = std::max(1, options.min_actions);

    std::vector<Node> nodes;
    nodes.reserve(4096);
    std::unordered_set<std::uint32_t> seen;
    std::deque<std::int32_t> frontier;

    Node root{};
    for (std::size_t i = 0; i < count; ++i) root.pos[i] = sorted[i].pos;
    root.parent = -1;
    root.token = 0;
    root.dir = Direction::Up;
    root.depth = 0;
    nodes.push_back(root);
    seen.insert(pack_key(root.pos, count));
    frontier.push_back(0);

    SearchResult result;
    int last_depth = -1;

    while (!frontier.empty()) {
        if (result.states_explored >= options.max_states) {
            result.status = SearchStatus::SearchSpaceExhausted;
            result.message = "state limit of " + std::to_string(options.max_states) + " reached";
            return result;
        }

        const std::int32_t current = frontier.front();
        frontier.pop_front();
        ++result.states_explored;

        // Cópia: 'nodes' pode realocar durante a expansão.
        const Node node = nodes[static_cast<std::size_t>(current)];
        if (options.debug_level >= 2 && node.depth != last_depth) {
            last_depth = node.depth;
            LogMsgs::Search::log_depth_reached(node.depth, result.states_explored, frontier.size());
        }

        for (std::size_t t = 0; t < count; ++t) {
            for (Direction d : SEARCH_DIRECTIONS) {
                const Pos to = simulator.slide(sorted[t].color, t, d, node.pos.data(), count);
                if (to == node.pos[t]) continue;

                Node child = node;
                child.pos[t] = to;
                child.parent = current;
                child.token = static_cast<std::uint8_t>(t);
                child.dir = d;
                child.depth = static_cast<std::uint16_t>(node.depth + 1);

                if (t == target_index && to == goal) {
                    if (child.depth < min_actions) {
                        if (options.debug_level >= 2) {
                            LogMsgs::Search::log_rejected_single_action(sorted[t].color, d, goal);
                        }
                        continue;
                    }
                    nodes.push_back(child);
                    result.status = SearchStatus::Solved;
                    result.actions = rebuild_actions(nodes, static_cast<std::int32_t>(nodes.size() - 1), sorted);
                    result.action_count = static_cast<int>(result.actions.size());
                    return result;
                }

                if (!seen.insert(pack_key(child.pos, count)).second) continue;

                if (options.debug_level >= 3) {
                    LogMsgs::Search::log_expansion(child.depth, sorted[t].color, d, node.pos[t], to);
                }
                nodes.push_back(child);
                frontier.push_back(static_cast<std::int32_t>(nodes.size() - 1));
            }
        }
    }

    result.status = SearchStatus::NoPath;
    result.message = "every reachable configuration explored";
    return result;
}

std::vector<Action> PathFinder::rebuild_actions(const std::vector<Node>& nodes, std::int32_t last,
                                                const std::vector<Token>& sorted) const {
    std::vector<std::int32_t> chain;
    for (std::int32_t i = last; nodes[static_cast<std::size_t>(i)].parent != -1;
         i = nodes[static_cast<std::size_t>(i)].parent) {
        chain.push_back(i);
    }
    std::reverse(chain.begin(), chain.end());

    const std::size_t count = sorted.size();
    std::vector<Action> actions;
    actions.reserve(chain.size());
    for (std::int32_t idx : chain) {
        const Node& n = nodes[static_cast<std::size_t>(idx)];
        const Node& p = nodes[static_cast<std::size_t>(n.parent)];
        MoveResult mr = simulator.simulate(sorted[n.token].color, n.token, n.dir, p.pos.data(), count);
        actions.push_back({sorted[n.token].color, n.dir, mr.start, mr.final_pos, std::move(mr.segments)});
    }
    return actions;
}

SearchResult find_path(const Board& board, const std::vector<Token>& tokens,
                       Color target, Pos goal, const SearchOptions& options) {
    return PathFinder(board, options).find_path(tokens, target, goal);
}
