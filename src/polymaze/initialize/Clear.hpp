#pragma once
#include "Common.hpp"

/**
 * @file Clear.hpp
 * @brief Abre todas as paredes internas da área candidata.
 */

namespace polymaze {
namespace methods {

/// Não usa aleatoriedade; o resultado é uma área aberta, não um labirinto.
template <typename T>
void clear(Maze<T>& maze, Randomizer&, const Matrix<bool>& candidates) {
    open_inner_walls(maze, candidates);
}

} // namespace methods
} // namespace polymaze
