#pragma once
#include <utility>
#include <vector>
#include "Wall.hpp"

/**
 * @file Tri.hpp
 * @brief Catálogo de paredes e geometria de salas triangulares.
 *
 * Salas com `(col + row)` par têm a aresta plana em cima; as demais
 * (invertidas) têm a aresta plana embaixo. Não existe parede oposta.
 */

namespace polymaze {
namespace tri {

extern const Wall LEFT0;
extern const Wall RIGHT1;
extern const Wall LEFT1;
extern const Wall RIGHT0;
extern const Wall UP;
extern const Wall DOWN;

const std::vector<const Wall*>& all_walls();
/// Paredes de uma sala; depende de `(col + row) mod 2`.
const std::vector<const Wall*>& walls(Pos pos);
WallIndex back_index(WallIndex index);
/// Sempre nullptr.
const Wall* opposite(const WallPos& wall_pos);
PhysicalPos center(Pos pos);
Pos room_at(PhysicalPos pos);
std::pair<int, int> minimal_dimensions(float width, float height);

/// Indica se a sala tem a aresta plana embaixo.
bool is_reversed(Pos pos);

} // namespace tri
} // namespace polymaze
