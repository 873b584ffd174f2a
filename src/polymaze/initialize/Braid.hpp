#pragma once
#include <set>
#include <utility>
#include "Common.hpp"

/**
 * @file Braid.hpp
 * @brief Labirinto sem becos sem saída (com laços).
 */

namespace polymaze {
namespace methods {

/**
 * @brief Parte da área toda aberta e fecha paredes em ordem aleatória,
 *        desde que as duas salas continuem com mais de duas paredes abertas.
 *
 * Termina com connect_all() para religar regiões que tenham ficado isoladas.
 */
template <typename T>
void braid(Maze<T>& maze, Randomizer& rng, const Matrix<bool>& candidates) {
    open_inner_walls(maze, candidates);

    // Cada parede interna aparece uma vez, vista da sala de cima (ou da esquerda)
    std::set<WallPos> unique;
    for (Pos pos : maze.positions()) {
        if (!candidates[pos]) continue;
        for (const WallPos& wp : maze.wall_positions(pos)) {
            const WallPos back = maze.back(wp);
            if (!is_candidate(candidates, back.pos)) continue;
            const int dx = wp.pos.col - back.pos.col;
            const int dy = wp.pos.row - back.pos.row;
            unique.insert(dy < 0 || (dy == 0 && dx < 0) ? wp : back);
        }
    }

    std::vector<WallPos> walls(unique.begin(), unique.end());
    const std::size_t len = walls.size();
    for (std::size_t i = 0; i < len; ++i) {
        std::swap(walls[i], walls[rng.range(0, len)]);
    }

    for (const WallPos& wp : walls) {
        const WallPos back = maze.back(wp);
        if (maze[wp.pos].open_walls() > 2 && maze[back.pos].open_walls() > 2) {
            maze.close(wp);
        }
    }

    connect_all(maze, rng, [&](Pos pos) { return is_candidate(candidates, pos); });
}

} // namespace methods
} // namespace polymaze
