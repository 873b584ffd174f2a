#pragma once
#include "Common.hpp"

/**
 * @file Branching.hpp
 * @brief Árvore geradora aleatória (Prim aleatorizado): labirintos ramificados sem laços.
 */

namespace polymaze {
namespace methods {

/**
 * @brief Gera uma floresta geradora sobre as salas candidatas.
 *
 * Sorteia uma sala semente, mantém uma fronteira de paredes e abre uma
 * parede sorteada sempre que ela leva a uma sala ainda não visitada. Quando a
 * fronteira esvazia e ainda restam candidatas (região desconexa), recomeça
 * com outra semente.
 *
 * @param candidates salas participantes; consumida durante a geração
 */
template <typename T>
void branching(Maze<T>& maze, Randomizer& rng, Matrix<bool> candidates) {
    while (const auto seed = random_room(rng, candidates)) {
        // A semente sai do sorteio mesmo que não tenha vizinhas candidatas
        candidates[*seed] = false;
        maze[*seed].visited = true;

        std::vector<WallPos> walls;
        for (const Wall* wall : maze.walls(*seed)) {
            const WallPos wp{*seed, wall};
            if (maze.is_inside(maze.back(wp).pos)) walls.push_back(wp);
        }

        while (!walls.empty()) {
            const std::size_t index = rng.range(0, walls.size());
            const WallPos wall_pos = walls[index];
            walls.erase(walls.begin() + static_cast<std::ptrdiff_t>(index));

            const Pos next = maze.back(wall_pos).pos;
            if (!candidates[next]) continue;

            candidates[wall_pos.pos] = false;
            candidates[next] = false;
            maze.open(wall_pos);

            for (const Wall* wall : maze.walls(next)) {
                const WallPos wp{next, wall};
                if (is_candidate(candidates, maze.back(wp).pos)) walls.push_back(wp);
            }
        }
    }
}

} // namespace methods
} // namespace polymaze
