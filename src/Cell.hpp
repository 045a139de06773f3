// ============================================================================
// Cell.hpp — Conteúdo imutável de cada posição da grelha
// ----------------------------------------------------------------------------
// - Cell: coordenada, 4 paredes (bitmask indexada por Side), no máximo um
//   Refractor e no máximo um Goal.
// - Refractor: célula diagonal colorida; transparente para peças da mesma
//   cor, desvia 90º as restantes.
// - Goal: objetivo com forma e cor (ou Wildcard = aceita qualquer cor).
// ============================================================================
#ifndef CELL_HPP
#define CELL_HPP

#pragma once
#include "Constants.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct Refractor {
    Pos pos;
    RefractorOrientation orientation = RefractorOrientation::Backslash;
    Color color = Color::Red;

    bool is_transparent_to(Color token) const { return token == color; }

    // Direção de saída para uma peça que entra a mover-se em 'in'.
    Direction refract(Direction in, Color token) const;

    bool operator==(const Refractor& o) const {
        return pos == o.pos && orientation == o.orientation && color == o.color;
    }
};

struct Goal {
    Pos pos;
    Shape shape = Shape::Circle;
    Color color = Color::Wildcard;
    std::string id;

    bool accepts(Color token) const {
        return color == Color::Wildcard || color == token;
    }

    bool operator==(const Goal& o) const {
        return pos == o.pos && shape == o.shape && color == o.color && id == o.id;
    }
};

class Cell {
public:
    Cell() = default;
    explicit Cell(Pos p) : pos(p) {}

    Pos get_pos() const { return pos; }

    bool has_wall(Side s) const { return (walls & side_bit(s)) != 0; }
    void set_wall(Side s, bool value = true);
    std::uint8_t wall_mask() const { return walls; }
    int wall_count() const;

    bool has_refractor() const { return refractor.has_value(); }
    bool has_goal() const { return goal.has_value(); }
    const std::optional<Refractor>& get_refractor() const { return refractor; }
    const std::optional<Goal>& get_goal() const { return goal; }

    // A posição do conteúdo é sempre sincronizada com a da célula.
    void set_refractor(const Refractor& r);
    void set_goal(const Goal& g);

    bool is_empty() const { return !refractor && !goal; }
    void clear_content();
    // Fecha os quatro lados e remove o conteúdo (zona morta).
    void seal();

    bool operator==(const Cell& o) const {
        return pos == o.pos && walls == o.walls && refractor == o.refractor && goal == o.goal;
    }
    bool operator!=(const Cell& o) const { return !(*this == o); }

private:
    static constexpr std::uint8_t side_bit(Side s) {
        return static_cast<std::uint8_t>(1u << index_of(s));
    }

    Pos pos;
    std::uint8_t walls = 0;
    std::optional<Refractor> refractor;
    std::optional<Goal> goal;
};

#endif // CELL_HPP
