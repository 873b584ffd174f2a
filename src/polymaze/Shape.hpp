#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Geometry.hpp"
#include "Wall.hpp"

/**
 * @file Shape.hpp
 * @brief Formatos de sala e despacho da geometria para cada formato.
 *
 * O despacho é feito por `switch` sobre o formato; não há classes virtuais.
 */

namespace polymaze {

/**
 * @brief Formato das salas; o valor é o número de paredes de cada sala.
 */
enum class Shape : uint8_t {
    Tri = 3,
    Quad = 4,
    Hex = 6,
};

/// Converte um número de paredes (3, 4 ou 6) em formato.
std::optional<Shape> shape_from_walls(uint32_t walls);
/// Converte "tri", "quad" ou "hex" em formato.
std::optional<Shape> shape_from_name(const std::string& name);
const char* shape_name(Shape shape);
/// Número de paredes por sala.
std::size_t wall_count(Shape shape);

/// Todas as paredes do formato, indexadas por Wall::index.
const std::vector<const Wall*>& all_walls(Shape shape);
/// Paredes de uma sala específica, em ordem angular.
const std::vector<const Wall*>& walls(Shape shape, Pos pos);

/**
 * @brief A mesma parede vista da sala do outro lado.
 *
 * `back(back(wp)) == wp` para toda parede.
 */
WallPos back(Shape shape, const WallPos& wall_pos);

/// Parede oposta na mesma sala, ou nullptr (formato triangular).
const Wall* opposite(Shape shape, const WallPos& wall_pos);

/// Centro físico de uma sala.
PhysicalPos center(Shape shape, Pos pos);

/// Sala que contém o ponto físico.
Pos room_at(Shape shape, PhysicalPos pos);

/**
 * @brief Parede da sala sob `pos` cujo intervalo angular contém a direção
 *        do centro da sala até `pos`.
 */
WallPos wall_pos_at(Shape shape, PhysicalPos pos);

/**
 * @brief Menor grade (colunas, linhas) cuja caixa cobre a área física dada.
 */
std::pair<int, int> minimal_dimensions(Shape shape, float width, float height);

/// Caixa que envolve todos os cantos de uma grade `cols` × `rows`.
ViewBox viewbox(Shape shape, int cols, int rows);

/**
 * @brief Paredes que compartilham o canto inicial de `wall_pos`.
 *
 * O primeiro elemento é a própria parede; os demais seguem a tabela
 * `corner_wall_offsets`.
 */
std::vector<WallPos> corner_walls(Shape shape, const WallPos& wall_pos);

/**
 * @brief Anel de posições à distância (Chebyshev) `distance` de `pos`.
 *
 * Ordem: linha de cima, coluna da direita, linha de baixo invertida e
 * coluna da esquerda invertida. Com distância 0 retorna apenas `pos`.
 */
std::vector<Pos> surround(Pos pos, int distance);

} // namespace polymaze
