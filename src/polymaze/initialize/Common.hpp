#pragma once
#include <optional>
#include <vector>
#include "polymaze/Log.hpp"
#include "polymaze/Maze.hpp"
#include "polymaze/Randomizer.hpp"

/**
 * @file Common.hpp
 * @brief Funções auxiliares compartilhadas pelos métodos de inicialização.
 */

namespace polymaze {

/// Indica se `pos` está na grade e marcada como candidata.
inline bool is_candidate(const Matrix<bool>& candidates, Pos pos) {
    const bool* c = candidates.get(pos);
    return c && *c;
}

/**
 * @brief Sorteia uma das salas ainda candidatas.
 * @return std::nullopt se não houver nenhuma
 */
inline std::optional<Pos> random_room(Randomizer& rng, const Matrix<bool>& candidates) {
    std::size_t count = 0;
    for (Pos pos : candidates.positions()) {
        if (candidates[pos]) ++count;
    }
    if (count == 0) return std::nullopt;

    std::size_t n = rng.range(0, count);
    for (Pos pos : candidates.positions()) {
        if (candidates[pos] && n-- == 0) return pos;
    }
    return std::nullopt;
}

/**
 * @brief Sorteia uma parede de `pos` que leva a uma sala candidata.
 */
template <typename T>
std::optional<WallPos> random_wall(Randomizer& rng, const Matrix<bool>& candidates,
                                   Pos pos, const Maze<T>& maze) {
    std::vector<const Wall*> options;
    for (const Wall* wall : maze.walls(pos)) {
        if (is_candidate(candidates, maze.back(WallPos{pos, wall}).pos)) options.push_back(wall);
    }
    if (options.empty()) return std::nullopt;
    return WallPos{pos, options[rng.range(0, options.size())]};
}

/**
 * @brief Abre todas as paredes entre pares de salas candidatas.
 */
template <typename T>
void open_inner_walls(Maze<T>& maze, const Matrix<bool>& candidates) {
    for (Pos pos : maze.positions()) {
        if (!candidates[pos]) continue;
        for (const Wall* wall : maze.walls(pos)) {
            const WallPos wp{pos, wall};
            if (is_candidate(candidates, maze.back(wp).pos)) maze.open(wp);
        }
    }
}

/**
 * @brief Garante que toda região de salas aceitas por `filter` tenha uma
 *        passagem para cada região vizinha.
 *
 * As regiões são numeradas por preenchimento através de paredes abertas;
 * para cada par de regiões adjacentes uma parede da fronteira é aberta ao acaso.
 */
template <typename T, typename F>
void connect_all(Maze<T>& maze, Randomizer& rng, F filter) {
    Matrix<unsigned> areas(maze.width(), maze.height(), 0u);
    unsigned index = 0;
    for (Pos pos : maze.positions()) {
        if (!filter(pos) || areas[pos] > 0) continue;
        ++index;
        areas.fill(pos, index, [&](Pos p) {
            std::vector<Pos> result;
            for (Pos n : maze.neighbors(p)) {
                if (filter(n)) result.push_back(n);
            }
            return result;
        });
    }

    std::size_t bridges = 0;
    for (const auto& edge : areas.edges([&](Pos p) { return maze.adjacent(p); })) {
        if (edge.first.first == 0) continue;
        std::vector<WallPos> wall_positions;
        for (const auto& pair : edge.second) {
            if (auto wp = maze.connecting_wall(pair.first, pair.second)) wall_positions.push_back(*wp);
        }
        if (wall_positions.empty()) continue;
        maze.open(wall_positions[rng.range(0, wall_positions.size())]);
        ++bridges;
    }
    POLYMAZE_LOG("INIT", "connect_all: %u areas, %zu bridges", index, bridges);
}

} // namespace polymaze
