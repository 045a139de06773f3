#include "Rotator.hpp"
#include <stdexcept>

namespace Rotator {

Pos rotate_point(Pos p, Rotation angle, int size) {
    const int max_index = size - 1;
    switch (angle) {
        case Rotation::R0:   return p;
        case Rotation::R90:  return {max_index - p.y, p.x};
        case Rotation::R180: return {max_index - p.x, max_index - p.y};
        case Rotation::R270: return {p.y, max_index - p.x};
    }
    return p;
}

Side rotate_side(Side s, Rotation angle) {
    return static_cast<Side>((index_of(s) + static_cast<int>(angle)) % 4);
}

Direction rotate_direction(Direction d, Rotation angle) {
    return static_cast<Direction>((index_of(d) + static_cast<int>(angle)) % 4);
}

RefractorOrientation rotate_orientation(RefractorOrientation o, Rotation angle) {
    if (angle == Rotation::R0 || angle == Rotation::R180) return o;
    return o == RefractorOrientation::Backslash ? RefractorOrientation::Slash
                                                : RefractorOrientation::Backslash;
}

Corner corner_of(Pos p, int size) {
    const int m = size - 1;
    if (p.x == 0 && p.y == 0) return Corner::TopLeft;
    if (p.x == m && p.y == 0) return Corner::TopRight;
    if (p.x == m && p.y == m) return Corner::BottomRight;
    if (p.x == 0 && p.y == m) return Corner::BottomLeft;
    throw std::invalid_argument("Invalid gap position: " + to_string(p));
}

Pos corner_cell(Corner c, int size) {
    const int m = size - 1;
    switch (c) {
        case Corner::TopLeft:     return {0, 0};
        case Corner::TopRight:    return {m, 0};
        case Corner::BottomRight: return {m, m};
        case Corner::BottomLeft:  return {0, m};
    }
    return {0, 0};
}

Rotation rotation_between(Corner from, Corner to) {
    const int turns = (static_cast<int>(to) - static_cast<int>(from) + 4) % 4;
    return static_cast<Rotation>(turns);
}

} // namespace Rotator
