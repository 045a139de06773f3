// ============================================================================
// MoveSimulator.hpp — Simulação de uma ação (deslizar + refração)
// ----------------------------------------------------------------------------
// Uma ação desliza a peça célula a célula até ser bloqueada por:
//   - limite do tabuleiro;
//   - célula seguinte dentro da zona morta;
//   - parede da célula atual virada para a direção do movimento;
//   - outra peça na célula seguinte.
// Ao entrar num refrator:
//   - mesma cor -> atravessa (sem quebra de segmento);
//   - cor diferente -> muda de direção pela tabela e começa novo segmento.
// Um par (posição, direção) repetido indica ciclo de refração: a peça pára.
// ============================================================================
#ifndef MOVE_SIMULATOR_HPP
#define MOVE_SIMULATOR_HPP

#pragma once
#include "Board.hpp"
#include "Constants.hpp"
#include "Token.hpp"
#include <cstddef>
#include <vector>

struct Segment {
    Pos start;
    Direction direction = Direction::Up;
    Pos end;

    bool operator==(const Segment& o) const {
        return start == o.start && direction == o.direction && end == o.end;
    }
};

struct MoveResult {
    bool moved = false;          // posição final != posição inicial
    Pos start;
    Pos final_pos;
    std::vector<Segment> segments;
    bool cycle_detected = false;
};

class MoveSimulator {
public:
    explicit MoveSimulator(const Board& board) : board(board) {}

    /**
     * Simula a ação da peça 'self' (cor 'color') na direção 'dir'.
     * 'positions' contém as posições de todas as peças (incluindo a própria).
     */
    MoveResult simulate(Color color, std::size_t self, Direction dir,
                        const Pos* positions, std::size_t count) const;

    MoveResult simulate(const std::vector<Token>& tokens, std::size_t index, Direction dir) const;

    // Variante sem registo de segmentos (caminho quente da pesquisa).
    Pos slide(Color color, std::size_t self, Direction dir,
              const Pos* positions, std::size_t count) const;

private:
    const Board& board;

    bool is_blocked(Pos from, Direction dir, std::size_t self,
                    const Pos* positions, std::size_t count) const;

    Pos run(Color color, std::size_t self, Direction dir,
            const Pos* positions, std::size_t count,
            std::vector<Segment>* segments, bool* cycle) const;
};

#endif // MOVE_SIMULATOR_HPP
