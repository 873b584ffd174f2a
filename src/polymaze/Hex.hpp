#pragma once
#include <utility>
#include <vector>
#include "Wall.hpp"

/**
 * @file Hex.hpp
 * @brief Catálogo de paredes e geometria de salas hexagonais.
 *
 * Hexágonos com vértice para cima; linhas ímpares são deslocadas meia sala
 * para a esquerda. As paredes diagonais existem em duas variantes (sufixos
 * 0 e 1) porque o deslocamento até a sala vizinha depende da paridade da linha.
 */

namespace polymaze {
namespace hex {

extern const Wall LEFT0;
extern const Wall RIGHT0;
extern const Wall LEFT1;
extern const Wall RIGHT1;
extern const Wall UP_LEFT0;
extern const Wall DOWN_RIGHT1;
extern const Wall UP_LEFT1;
extern const Wall DOWN_RIGHT0;
extern const Wall UP_RIGHT0;
extern const Wall DOWN_LEFT1;
extern const Wall UP_RIGHT1;
extern const Wall DOWN_LEFT0;

const std::vector<const Wall*>& all_walls();
/// Paredes de uma sala; depende de `row mod 2`.
const std::vector<const Wall*>& walls(Pos pos);
WallIndex back_index(WallIndex index);
const Wall* opposite(const WallPos& wall_pos);
PhysicalPos center(Pos pos);
/// Sala cujo centro é o mais próximo de `pos`.
Pos room_at(PhysicalPos pos);
std::pair<int, int> minimal_dimensions(float width, float height);

} // namespace hex
} // namespace polymaze
