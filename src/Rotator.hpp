// ============================================================================
// Rotator.hpp — Transformações de orientação (rotação no sentido horário)
// ----------------------------------------------------------------------------
// Funções puras sobre os quatro ângulos canónicos:
//   0º   -> (x, y)
//   90º  -> (size-1-y, x)
//   180º -> (size-1-x, size-1-y)
//   270º -> (y, size-1-x)
// Lados/direções rodam por deslocamento cíclico de angle/90 passos.
// ============================================================================
#ifndef ROTATOR_HPP
#define ROTATOR_HPP

#pragma once
#include "Constants.hpp"

namespace Rotator {

Pos rotate_point(Pos p, Rotation angle, int size = MODULE_SIZE);
Side rotate_side(Side s, Rotation angle);
Direction rotate_direction(Direction d, Rotation angle);

// '\' <-> '/' a 90º e 270º; inalterado a 0º e 180º.
RefractorOrientation rotate_orientation(RefractorOrientation o, Rotation angle);

// Canto correspondente a uma célula de canto; lança std::invalid_argument
// se o ponto não for um canto da grelha size x size.
Corner corner_of(Pos p, int size = MODULE_SIZE);
Pos corner_cell(Corner c, int size = MODULE_SIZE);

// Nº de quartos de volta (horário) que levam o canto 'from' até 'to'.
Rotation rotation_between(Corner from, Corner to);

} // namespace Rotator

#endif // ROTATOR_HPP
