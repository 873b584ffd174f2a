/**
 * @file Tri.cpp
 * @brief Tabelas de paredes triangulares.
 */
#include "Tri.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "Shape.hpp"

namespace polymaze {
namespace tri {

namespace {
constexpr float D = PI / 6.0f;
constexpr float HORIZONTAL_MULTIPLICATOR = COS_30;
constexpr float VERTICAL_MULTIPLICATOR = 1.5f;
/// Distância vertical entre o centroide e o meio da linha.
constexpr float OFFSET = 0.25f;

constexpr WallIndex I_LEFT0 = 0;
constexpr WallIndex I_RIGHT1 = 1;
constexpr WallIndex I_LEFT1 = 2;
constexpr WallIndex I_RIGHT0 = 3;
constexpr WallIndex I_UP = 4;
constexpr WallIndex I_DOWN = 5;

constexpr Angle A1{1.0f * D, COS_30, SIN_30};
constexpr Angle A3{3.0f * D, 0.0f, 1.0f};
constexpr Angle A5{5.0f * D, -COS_30, SIN_30};
constexpr Angle A7{7.0f * D, -COS_30, -SIN_30};
constexpr Angle A9{9.0f * D, 0.0f, -1.0f};
constexpr Angle A11{11.0f * D, COS_30, -SIN_30};

constexpr Offset LEFT0_CORNERS[] = {
    {-1, 0, I_DOWN}, {-1, 1, I_RIGHT0}, {0, 1, I_RIGHT1}, {1, 1, I_UP}, {1, 0, I_LEFT1}};
constexpr Offset RIGHT1_CORNERS[] = {
    {1, 0, I_UP}, {1, -1, I_LEFT1}, {0, -1, I_LEFT0}, {-1, -1, I_DOWN}, {-1, 0, I_RIGHT0}};
constexpr Offset LEFT1_CORNERS[] = {
    {-1, 0, I_LEFT0}, {-2, 0, I_DOWN}, {-2, 1, I_RIGHT0}, {-1, 1, I_RIGHT1}, {0, 1, I_UP}};
constexpr Offset RIGHT0_CORNERS[] = {
    {1, 0, I_RIGHT1}, {2, 0, I_UP}, {2, -1, I_LEFT1}, {1, -1, I_LEFT0}, {0, -1, I_DOWN}};
constexpr Offset UP_CORNERS[] = {
    {0, -1, I_LEFT1}, {-1, -1, I_LEFT0}, {-2, -1, I_DOWN}, {-2, 0, I_RIGHT0}, {-1, 0, I_RIGHT1}};
constexpr Offset DOWN_CORNERS[] = {
    {0, 1, I_RIGHT0}, {1, 1, I_RIGHT1}, {2, 1, I_UP}, {2, 0, I_LEFT1}, {1, 0, I_LEFT0}};
} // namespace

const Wall LEFT0{"LEFT0", Shape::Tri, 0, I_LEFT0, LEFT0_CORNERS, 5,
                 Pos{-1, 0}, Span{A3, A7}, &RIGHT0, &UP};
const Wall UP{"UP", Shape::Tri, 1, I_UP, UP_CORNERS, 5,
              Pos{0, -1}, Span{A7, A11}, &LEFT0, &RIGHT0};
const Wall RIGHT0{"RIGHT0", Shape::Tri, 2, I_RIGHT0, RIGHT0_CORNERS, 5,
                  Pos{1, 0}, Span{A11, A3}, &UP, &LEFT0};

const Wall LEFT1{"LEFT1", Shape::Tri, 0, I_LEFT1, LEFT1_CORNERS, 5,
                 Pos{-1, 0}, Span{A5, A9}, &DOWN, &RIGHT1};
const Wall RIGHT1{"RIGHT1", Shape::Tri, 1, I_RIGHT1, RIGHT1_CORNERS, 5,
                  Pos{1, 0}, Span{A9, A1}, &LEFT1, &DOWN};
const Wall DOWN{"DOWN", Shape::Tri, 2, I_DOWN, DOWN_CORNERS, 5,
                Pos{0, 1}, Span{A1, A5}, &RIGHT1, &LEFT1};

const std::vector<const Wall*>& all_walls() {
    static const std::vector<const Wall*> walls{
        &LEFT0, &RIGHT1, &LEFT1, &RIGHT0, &UP, &DOWN};
    return walls;
}

bool is_reversed(Pos pos) {
    return ((pos.col + pos.row) & 1) != 0;
}

const std::vector<const Wall*>& walls(Pos pos) {
    static const std::vector<const Wall*> upright{&LEFT0, &UP, &RIGHT0};
    static const std::vector<const Wall*> reversed{&LEFT1, &RIGHT1, &DOWN};
    return is_reversed(pos) ? reversed : upright;
}

WallIndex back_index(WallIndex index) {
    return index ^ 0b0001;
}

const Wall* opposite(const WallPos&) {
    return nullptr;
}

PhysicalPos center(Pos pos) {
    return {(static_cast<float>(pos.col) + 0.5f) * HORIZONTAL_MULTIPLICATOR,
            (static_cast<float>(pos.row) + 0.5f) * VERTICAL_MULTIPLICATOR
                + (is_reversed(pos) ? OFFSET : -OFFSET)};
}

Pos room_at(PhysicalPos pos) {
    const int row0 = partition(pos.y / VERTICAL_MULTIPLICATOR).first;
    const int col0 = partition(pos.x / HORIZONTAL_MULTIPLICATOR).first;

    // Os centroides formam uma rede hexagonal cujas células de Voronoi são os próprios triângulos
    Pos best{col0, row0};
    float best_distance = std::numeric_limits<float>::max();
    for (int row = row0 - 1; row <= row0 + 1; ++row) {
        for (int col = col0 - 2; col <= col0 + 2; ++col) {
            const Pos candidate{col, row};
            const float distance = (center(candidate) - pos).value();
            if (distance < best_distance) {
                best_distance = distance;
                best = candidate;
            }
        }
    }
    return best;
}

std::pair<int, int> minimal_dimensions(float width, float height) {
    const int cols = std::max(
        1, static_cast<int>(std::ceil(width / HORIZONTAL_MULTIPLICATOR - 1.0f)));
    const int rows = std::max(
        1, static_cast<int>(std::ceil(std::max(height, VERTICAL_MULTIPLICATOR)
                                      / VERTICAL_MULTIPLICATOR)));
    return {cols, rows};
}

} // namespace tri
} // namespace polymaze
