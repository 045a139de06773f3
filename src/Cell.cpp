#include "Cell.hpp"

Direction Refractor::refract(Direction in, Color token) const {
    // Mesma cor: atravessa sem desvio.
    if (is_transparent_to(token)) return in;
    return REFRACTION_TABLE[static_cast<int>(orientation)][index_of(in)];
}

void Cell::set_wall(Side s, bool value) {
    if (value) {
        walls = static_cast<std::uint8_t>(walls | side_bit(s));
    } else {
        walls = static_cast<std::uint8_t>(walls & ~side_bit(s));
    }
}

int Cell::wall_count() const {
    int n = 0;
    for (Side s : ALL_SIDES) {
        if (has_wall(s)) ++n;
    }
    return n;
}

void Cell::set_refractor(const Refractor& r) {
    refractor = r;
    refractor->pos = pos;
}

void Cell::set_goal(const Goal& g) {
    goal = g;
    goal->pos = pos;
}

void Cell::clear_content() {
    refractor.reset();
    goal.reset();
}

void Cell::seal() {
    for (Side s : ALL_SIDES) set_wall(s, true);
    clear_content();
}
