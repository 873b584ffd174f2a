#pragma once
#include "Common.hpp"

/**
 * @file Winding.hpp
 * @brief Busca em profundidade com retrocesso: corredores longos e sinuosos.
 */

namespace polymaze {
namespace methods {

template <typename T>
void winding(Maze<T>& maze, Randomizer& rng, Matrix<bool> candidates) {
    auto start = random_room(rng, candidates);
    if (!start) return;

    std::vector<Pos> path;
    Pos current = *start;
    for (;;) {
        candidates[current] = false;
        maze[current].visited = true;

        // (vizinha, parede a partir da sala atual)
        std::vector<std::pair<Pos, const Wall*>> neighbors;
        for (const Wall* wall : maze.walls(current)) {
            const Pos next = maze.back(WallPos{current, wall}).pos;
            if (is_candidate(candidates, next)) neighbors.emplace_back(next, wall);
        }

        if (!neighbors.empty()) {
            const auto& chosen = neighbors[rng.range(0, neighbors.size())];
            maze.open(WallPos{current, chosen.second});
            path.push_back(current);
            current = chosen.first;
        } else if (!path.empty()) {
            current = path.back();
            path.pop_back();
        } else if (auto next = random_room(rng, candidates)) {
            // Região desconexa: recomeça em outra sala
            current = *next;
        } else {
            break;
        }
    }
}

} // namespace methods
} // namespace polymaze
