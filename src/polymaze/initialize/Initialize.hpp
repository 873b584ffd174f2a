#pragma once
#include "Braid.hpp"
#include "Branching.hpp"
#include "Clear.hpp"
#include "Common.hpp"
#include "Dividing.hpp"
#include "Method.hpp"
#include "Spelunker.hpp"
#include "Winding.hpp"

/**
 * @file Initialize.hpp
 * @brief Ponto de entrada dos métodos de inicialização.
 *
 * O labirinto deve estar todo fechado; paredes já abertas são mantidas.
 * O resultado é reprodutível quando o randomizador é determinístico.
 */

namespace polymaze {

/**
 * @brief Inicializa apenas as salas aceitas por `predicate`.
 *
 * As demais ficam totalmente fechadas e não são tocadas. Sem nenhuma sala
 * candidata o labirinto não é alterado.
 */
template <typename T, typename F>
void initialize_filter(Maze<T>& maze, const Method& method, Randomizer& rng, F predicate) {
    auto selected = filter(maze.width(), maze.height(), predicate);
    const std::string name = method_name(method);
    if (selected.first == 0) {
        POLYMAZE_LOG("INIT", "%s: no candidate rooms", name.c_str());
        return;
    }
    POLYMAZE_LOG("INIT", "%s: %zu candidate rooms (%s %dx%d)", name.c_str(), selected.first,
                 shape_name(maze.shape()), maze.width(), maze.height());

    Matrix<bool>& candidates = selected.second;
    switch (method.kind) {
        case Method::Kind::Braid: methods::braid(maze, rng, candidates); break;
        case Method::Kind::Branching: methods::branching(maze, rng, candidates); break;
        case Method::Kind::Clear: methods::clear(maze, rng, candidates); break;
        case Method::Kind::Dividing: methods::dividing(maze, rng, candidates); break;
        case Method::Kind::Spelunker:
            methods::spelunker(maze, rng, candidates, method.instructions);
            break;
        case Method::Kind::Winding: methods::winding(maze, rng, candidates); break;
    }
}

/// Inicializa todas as salas.
template <typename T>
void initialize(Maze<T>& maze, const Method& method, Randomizer& rng) {
    initialize_filter(maze, method, rng, [](Pos) { return true; });
}

} // namespace polymaze
