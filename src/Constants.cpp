#include "Constants.hpp"
#include <stdexcept>

Rotation compose(Rotation a, Rotation b) {
    return static_cast<Rotation>((static_cast<int>(a) + static_cast<int>(b)) % 4);
}

Rotation inverse(Rotation a) {
    return static_cast<Rotation>((4 - static_cast<int>(a)) % 4);
}

int degrees(Rotation a) {
    return static_cast<int>(a) * 90;
}

Rotation rotation_from_degrees(int deg) {
    switch (deg) {
        case 0:   return Rotation::R0;
        case 90:  return Rotation::R90;
        case 180: return Rotation::R180;
        case 270: return Rotation::R270;
        default:
            throw std::invalid_argument("Invalid rotation angle: " + std::to_string(deg));
    }
}

const char* to_string(Color c) {
    switch (c) {
        case Color::Red:      return "red";
        case Color::Yellow:   return "yellow";
        case Color::Blue:     return "blue";
        case Color::Green:    return "green";
        case Color::Wildcard: return "rainbow";
    }
    return "?";
}

const char* to_string(Side s) {
    switch (s) {
        case Side::Top:    return "top";
        case Side::Right:  return "right";
        case Side::Bottom: return "bottom";
        case Side::Left:   return "left";
    }
    return "?";
}

const char* to_string(Direction d) {
    switch (d) {
        case Direction::Up:    return "up";
        case Direction::Right: return "right";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
    }
    return "?";
}

const char* to_string(Shape s) {
    switch (s) {
        case Shape::Circle:   return "circle";
        case Shape::Triangle: return "triangle";
        case Shape::Square:   return "square";
        case Shape::Hexagon:  return "hexagon";
    }
    return "?";
}

const char* to_string(Quadrant q) {
    switch (q) {
        case Quadrant::TopLeft:     return "topLeft";
        case Quadrant::TopRight:    return "topRight";
        case Quadrant::BottomLeft:  return "bottomLeft";
        case Quadrant::BottomRight: return "bottomRight";
    }
    return "?";
}

char to_char(RefractorOrientation o) {
    return o == RefractorOrientation::Backslash ? '\\' : '/';
}

std::string to_string(Pos p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}

std::optional<Color> parse_color(const std::string& s) {
    if (s == "red" || s == "R")    return Color::Red;
    if (s == "yellow" || s == "Y") return Color::Yellow;
    if (s == "blue" || s == "B")   return Color::Blue;
    if (s == "green" || s == "G")  return Color::Green;
    if (s == "rainbow" || s == "wildcard" || s == "*") return Color::Wildcard;
    return std::nullopt;
}

std::optional<Direction> parse_direction(const std::string& s) {
    if (s == "up" || s == "u")    return Direction::Up;
    if (s == "right" || s == "r") return Direction::Right;
    if (s == "down" || s == "d")  return Direction::Down;
    if (s == "left" || s == "l")  return Direction::Left;
    return std::nullopt;
}

std::optional<Side> parse_side(const std::string& s) {
    if (s == "top")    return Side::Top;
    if (s == "right")  return Side::Right;
    if (s == "bottom") return Side::Bottom;
    if (s == "left")   return Side::Left;
    return std::nullopt;
}

std::optional<Shape> parse_shape(const std::string& s) {
    if (s == "circle")   return Shape::Circle;
    if (s == "triangle") return Shape::Triangle;
    if (s == "square")   return Shape::Square;
    if (s == "hexagon")  return Shape::Hexagon;
    return std::nullopt;
}

std::optional<RefractorOrientation> parse_orientation(char c) {
    if (c == '\\') return RefractorOrientation::Backslash;
    if (c == '/')  return RefractorOrientation::Slash;
    return std::nullopt;
}
