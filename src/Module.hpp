// ============================================================================
// Module.hpp — Módulo 8x8 com duas faces
// ----------------------------------------------------------------------------
// - Cada módulo tem id, cor, canto do "gap" (o canto que ficava junto à zona
//   morta quando foi desenhado) e duas faces.
// - Uma face é descrita no espaço local não rodado: paredes explícitas,
//   refratores e objetivos. Não há paredes de perímetro implícitas.
// - materialize_face() gera a grelha 8x8 com paredes simétricas;
//   rotate() devolve a mesma grelha rodada (paredes, refratores, objetivos).
// ============================================================================
#ifndef MODULE_HPP
#define MODULE_HPP

#pragma once
#include "Cell.hpp"
#include "Constants.hpp"
#include <array>
#include <vector>

struct WallRecord {
    Pos pos;
    std::vector<Side> sides;
};

struct Face {
    std::vector<WallRecord> walls;
    std::vector<Refractor> refractors;
    std::vector<Goal> goals;
};

// Grelha local indexada por [y][x].
using ModuleGrid = std::array<std::array<Cell, MODULE_SIZE>, MODULE_SIZE>;

constexpr int FACES_PER_MODULE = 2;

class Module {
public:
    // Valida os dados de autor; lança std::invalid_argument se alguma
    // coordenada sair de 0..7, se um refrator não tiver cor concreta ou se
    // um objetivo não tiver id.
    Module(int id, Color color, Corner gap_corner, std::array<Face, FACES_PER_MODULE> faces);

    int get_id() const { return id; }
    Color get_color() const { return color; }
    Corner get_gap_corner() const { return gap_corner; }

    // Lança std::out_of_range para faces inexistentes.
    const Face& get_face(int face_id) const;

    ModuleGrid materialize_face(int face_id) const;
    ModuleGrid rotate(int face_id, Rotation angle) const;

    // Rotação que leva o canto do gap até ao canto interior do quadrante.
    Rotation rotation_for(Quadrant quadrant) const;

    static ModuleGrid empty_grid();
    static ModuleGrid rotate_grid(const ModuleGrid& grid, Rotation angle);

private:
    int id;
    Color color;
    Corner gap_corner;
    std::array<Face, FACES_PER_MODULE> faces;

    void validate() const;
};

#endif // MODULE_HPP
