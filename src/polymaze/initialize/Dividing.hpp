#pragma once
#include <cmath>
#include "Common.hpp"

/**
 * @file Dividing.hpp
 * @brief Divisão recursiva: cortes retos alternados sobre uma área aberta.
 */

namespace polymaze {
namespace methods {

namespace detail {

/// Corte de uma caixa por uma linha horizontal (y = at) ou vertical (x = at).
struct Split {
    ViewBox box;
    bool vertical;
    float at;

    static Split from_viewbox(const ViewBox& box, Randomizer& rng) {
        const float cut = 0.8f * static_cast<float>(rng.random()) + 0.2f;
        if (box.width > box.height) return Split{box, true, box.corner.x + cut * box.width};
        return Split{box, false, box.corner.y + cut * box.height};
    }

    /// Lado do corte em que o ponto fica.
    bool before(PhysicalPos pos) const { return vertical ? pos.x < at : pos.y < at; }
};

/// Margem, em salas, ao redor da linha de corte.
constexpr int SPLIT_MARGIN = 2;

template <typename T>
void apply_split(Maze<T>& maze, Randomizer& rng, const Matrix<bool>& candidates,
                 float threshold, const Split& split) {
    const ViewBox& box = split.box;
    const Pos a = split.vertical ? maze.room_at({split.at, box.corner.y})
                                 : maze.room_at({box.corner.x, split.at});
    const Pos b = split.vertical ? maze.room_at({split.at, box.corner.y + box.height})
                                 : maze.room_at({box.corner.x + box.width, split.at});

    // Fecha as paredes cujas salas ficam em lados opostos do corte
    const int col_lo = (a.col < b.col ? a.col : b.col) - SPLIT_MARGIN;
    const int col_hi = (a.col < b.col ? b.col : a.col) + SPLIT_MARGIN;
    const int row_lo = (a.row < b.row ? a.row : b.row) - SPLIT_MARGIN;
    const int row_hi = (a.row < b.row ? b.row : a.row) + SPLIT_MARGIN;
    for (int row = row_lo; row <= row_hi; ++row) {
        for (int col = col_lo; col <= col_hi; ++col) {
            const Pos pos{col, row};
            if (!is_candidate(candidates, pos)) continue;
            for (const WallPos& wp : maze.wall_positions(pos)) {
                const WallPos back = maze.back(wp);
                if (is_candidate(candidates, back.pos)
                    && split.before(maze.center(wp.pos)) != split.before(maze.center(back.pos))) {
                    maze.close(wp);
                }
            }
        }
    }

    const auto halves = split.vertical ? box.split_vertical(split.at)
                                       : box.split_horizontal(split.at);
    const Split parts[] = {Split::from_viewbox(halves.first, rng),
                           Split::from_viewbox(halves.second, rng)};
    for (const Split& part : parts) {
        if (!(part.box.width > threshold * (1.0f + static_cast<float>(rng.random())))) continue;
        if (part.box.height > threshold * (1.0f + static_cast<float>(rng.random()))) {
            apply_split(maze, rng, candidates, threshold, part);
        }
    }
}

} // namespace detail

/**
 * @brief Divide a área candidata recursivamente até as partes ficarem menores
 *        que o dobro da distância entre duas salas diagonais.
 *
 * Cada corte fecha todas as paredes que o atravessam; no final connect_all()
 * abre uma passagem entre cada par de partes vizinhas.
 */
template <typename T>
void dividing(Maze<T>& maze, Randomizer& rng, const Matrix<bool>& candidates) {
    open_inner_walls(maze, candidates);

    std::vector<PhysicalPos> corners;
    for (Pos pos : maze.positions()) {
        for (const WallPos& wp : maze.wall_positions(pos)) corners.push_back(maze.corners(wp).first);
    }
    const ViewBox box = ViewBox::enclosing(corners.begin(), corners.end());
    const float threshold = 2.0f * std::sqrt((maze.center({0, 0}) - maze.center({1, 1})).value());

    detail::apply_split(maze, rng, candidates, threshold, detail::Split::from_viewbox(box, rng));

    connect_all(maze, rng, [&](Pos pos) { return is_candidate(candidates, pos); });
}

} // namespace methods
} // namespace polymaze
