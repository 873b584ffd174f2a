/**
 * @file Quad.cpp
 * @brief Tabelas de paredes quadradas.
 */
#include "Quad.hpp"
#include <algorithm>
#include <cmath>
#include "Shape.hpp"

namespace polymaze {
namespace quad {

namespace {
constexpr float D = PI / 4.0f;
/// Lado do quadrado com cantos a distância 1 do centro.
constexpr float MULTIPLICATOR = 1.41421356f;

constexpr WallIndex I_LEFT = 0;
constexpr WallIndex I_UP = 1;
constexpr WallIndex I_RIGHT = 2;
constexpr WallIndex I_DOWN = 3;

constexpr Angle A1{1.0f * D, COS_45, SIN_45};
constexpr Angle A3{3.0f * D, -COS_45, SIN_45};
constexpr Angle A5{5.0f * D, -COS_45, -SIN_45};
constexpr Angle A7{7.0f * D, COS_45, -SIN_45};

constexpr Offset LEFT_CORNERS[] = {{-1, 0, I_DOWN}, {-1, 1, I_RIGHT}, {0, 1, I_UP}};
constexpr Offset UP_CORNERS[] = {{0, -1, I_LEFT}, {-1, -1, I_DOWN}, {-1, 0, I_RIGHT}};
constexpr Offset RIGHT_CORNERS[] = {{1, 0, I_UP}, {1, -1, I_LEFT}, {0, -1, I_DOWN}};
constexpr Offset DOWN_CORNERS[] = {{0, 1, I_RIGHT}, {1, 1, I_UP}, {1, 0, I_LEFT}};
} // namespace

const Wall LEFT{"LEFT", Shape::Quad, 0, I_LEFT, LEFT_CORNERS, 3,
                Pos{-1, 0}, Span{A3, A5}, &DOWN, &UP};
const Wall UP{"UP", Shape::Quad, 1, I_UP, UP_CORNERS, 3,
              Pos{0, -1}, Span{A5, A7}, &LEFT, &RIGHT};
const Wall RIGHT{"RIGHT", Shape::Quad, 2, I_RIGHT, RIGHT_CORNERS, 3,
                 Pos{1, 0}, Span{A7, A1}, &UP, &DOWN};
const Wall DOWN{"DOWN", Shape::Quad, 3, I_DOWN, DOWN_CORNERS, 3,
                Pos{0, 1}, Span{A1, A3}, &RIGHT, &LEFT};

const std::vector<const Wall*>& all_walls() {
    static const std::vector<const Wall*> walls{&LEFT, &UP, &RIGHT, &DOWN};
    return walls;
}

const std::vector<const Wall*>& walls(Pos) {
    return all_walls();
}

WallIndex back_index(WallIndex index) {
    return index ^ 0b0010;
}

const Wall* opposite(const WallPos& wall_pos) {
    return all_walls()[(wall_pos.wall->index + 2) % 4];
}

PhysicalPos center(Pos pos) {
    return {(static_cast<float>(pos.col) + 0.5f) * MULTIPLICATOR,
            (static_cast<float>(pos.row) + 0.5f) * MULTIPLICATOR};
}

Pos room_at(PhysicalPos pos) {
    return Pos{partition(pos.x / MULTIPLICATOR).first,
               partition(pos.y / MULTIPLICATOR).first};
}

std::pair<int, int> minimal_dimensions(float width, float height) {
    const int cols = static_cast<int>(std::ceil(std::max(width, MULTIPLICATOR) / MULTIPLICATOR));
    const int rows = static_cast<int>(std::ceil(std::max(height, MULTIPLICATOR) / MULTIPLICATOR));
    return {cols, rows};
}

} // namespace quad
} // namespace polymaze
