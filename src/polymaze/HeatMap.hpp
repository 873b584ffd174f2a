#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "Randomizer.hpp"
#include "Walk.hpp"

/**
 * @file HeatMap.hpp
 * @brief Contagem de quantos caminhos passam por cada sala.
 */

namespace polymaze {

/// Número de caminhos que atravessam cada sala.
using HeatMap = Matrix<uint32_t>;

/**
 * @brief Soma, para cada par (origem, destino), as salas do caminho entre eles.
 *
 * Pares sem caminho são ignorados. Mapas parciais podem ser combinados com
 * `operator+`.
 */
template <typename T, typename It>
HeatMap heatmap(const Maze<T>& maze, It first, It last) {
    HeatMap result(maze.width(), maze.height(), 0u);
    for (; first != last; ++first) {
        const std::pair<Pos, Pos>& pair = *first;
        if (const auto path = walk(maze, pair.first, pair.second)) {
            for (Pos pos : *path) result[pos] += 1;
        }
    }
    return result;
}

template <typename T>
HeatMap heatmap(const Maze<T>& maze, const std::vector<std::pair<Pos, Pos>>& pairs) {
    return heatmap(maze, pairs.begin(), pairs.end());
}

/**
 * @brief Sorteia `count` pares de salas em lados opostos do labirinto.
 *
 * Metade dos pares liga a coluna esquerda à direita; a outra, a linha de
 * cima à de baixo.
 */
inline std::vector<std::pair<Pos, Pos>> random_pairs(int width, int height, std::size_t count,
                                                     Randomizer& rng) {
    std::vector<std::pair<Pos, Pos>> pairs;
    if (width <= 0 || height <= 0) return pairs;
    pairs.reserve(count);
    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    for (std::size_t i = 0; i < count; ++i) {
        if (i % 2 == 0) {
            const int a = static_cast<int>(rng.range(0, h));
            const int b = static_cast<int>(rng.range(0, h));
            pairs.emplace_back(Pos{0, a}, Pos{width - 1, b});
        } else {
            const int a = static_cast<int>(rng.range(0, w));
            const int b = static_cast<int>(rng.range(0, w));
            pairs.emplace_back(Pos{a, 0}, Pos{b, height - 1});
        }
    }
    return pairs;
}

} // namespace polymaze
