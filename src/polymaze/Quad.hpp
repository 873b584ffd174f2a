#pragma once
#include <utility>
#include <vector>
#include "Wall.hpp"

/**
 * @file Quad.hpp
 * @brief Catálogo de paredes e geometria de salas quadradas.
 *
 * Cada sala ocupa um quadrado de lado √2 (diagonal 2), de forma que os
 * cantos fiquem a distância 1 do centro, como nos demais formatos.
 */

namespace polymaze {
namespace quad {

extern const Wall LEFT;
extern const Wall UP;
extern const Wall RIGHT;
extern const Wall DOWN;

/// Todas as paredes do formato, indexadas por Wall::index.
const std::vector<const Wall*>& all_walls();
/// Paredes de uma sala, na ordem angular (igual para todas as salas).
const std::vector<const Wall*>& walls(Pos pos);
/// Índice da parede vista do outro lado.
WallIndex back_index(WallIndex index);
/// Parede oposta dentro da mesma sala.
const Wall* opposite(const WallPos& wall_pos);
PhysicalPos center(Pos pos);
Pos room_at(PhysicalPos pos);
/// Menor (colunas, linhas) cuja caixa cobre a área (width, height).
std::pair<int, int> minimal_dimensions(float width, float height);

} // namespace quad
} // namespace polymaze
