/**
 * @file Hex.cpp
 * @brief Tabelas de paredes hexagonais.
 */
#include "Hex.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "Shape.hpp"

namespace polymaze {
namespace hex {

namespace {
constexpr float D = PI / 6.0f;
/// Distância horizontal entre centros vizinhos.
constexpr float HORIZONTAL_MULTIPLICATOR = 2.0f * COS_30;
/// Distância vertical entre centros de linhas consecutivas.
constexpr float VERTICAL_MULTIPLICATOR = 1.5f;

constexpr WallIndex I_LEFT0 = 0;
constexpr WallIndex I_RIGHT0 = 1;
constexpr WallIndex I_LEFT1 = 2;
constexpr WallIndex I_RIGHT1 = 3;
constexpr WallIndex I_UP_LEFT0 = 4;
constexpr WallIndex I_DOWN_RIGHT1 = 5;
constexpr WallIndex I_UP_LEFT1 = 6;
constexpr WallIndex I_DOWN_RIGHT0 = 7;
constexpr WallIndex I_UP_RIGHT0 = 8;
constexpr WallIndex I_DOWN_LEFT1 = 9;
constexpr WallIndex I_UP_RIGHT1 = 10;
constexpr WallIndex I_DOWN_LEFT0 = 11;

constexpr Angle A1{1.0f * D, COS_30, SIN_30};
constexpr Angle A3{3.0f * D, 0.0f, 1.0f};
constexpr Angle A5{5.0f * D, -COS_30, SIN_30};
constexpr Angle A7{7.0f * D, -COS_30, -SIN_30};
constexpr Angle A9{9.0f * D, 0.0f, -1.0f};
constexpr Angle A11{11.0f * D, COS_30, -SIN_30};

constexpr Offset LEFT0_CORNERS[] = {{-1, 0, I_DOWN_RIGHT0}, {0, 1, I_UP_RIGHT1}};
constexpr Offset UP_LEFT0_CORNERS[] = {{0, -1, I_DOWN_LEFT1}, {-1, 0, I_RIGHT0}};
constexpr Offset UP_RIGHT0_CORNERS[] = {{1, -1, I_LEFT1}, {0, -1, I_DOWN_RIGHT1}};
constexpr Offset RIGHT0_CORNERS[] = {{1, 0, I_UP_LEFT0}, {1, -1, I_DOWN_LEFT1}};
constexpr Offset DOWN_RIGHT0_CORNERS[] = {{1, 1, I_UP_RIGHT1}, {1, 0, I_LEFT0}};
constexpr Offset DOWN_LEFT0_CORNERS[] = {{0, 1, I_RIGHT1}, {1, 1, I_UP_LEFT1}};

constexpr Offset LEFT1_CORNERS[] = {{-1, 0, I_DOWN_RIGHT1}, {-1, 1, I_UP_RIGHT0}};
constexpr Offset UP_LEFT1_CORNERS[] = {{-1, -1, I_DOWN_LEFT0}, {-1, 0, I_RIGHT1}};
constexpr Offset UP_RIGHT1_CORNERS[] = {{0, -1, I_LEFT0}, {-1, -1, I_DOWN_RIGHT0}};
constexpr Offset RIGHT1_CORNERS[] = {{1, 0, I_UP_LEFT1}, {0, -1, I_DOWN_LEFT0}};
constexpr Offset DOWN_RIGHT1_CORNERS[] = {{0, 1, I_UP_RIGHT0}, {1, 0, I_LEFT1}};
constexpr Offset DOWN_LEFT1_CORNERS[] = {{-1, 1, I_RIGHT0}, {0, 1, I_UP_LEFT0}};

bool odd(int row) { return (row & 1) != 0; }
} // namespace

// Linhas pares
const Wall LEFT0{"LEFT0", Shape::Hex, 0, I_LEFT0, LEFT0_CORNERS, 2,
                 Pos{-1, 0}, Span{A5, A7}, &DOWN_LEFT0, &UP_LEFT0};
const Wall UP_LEFT0{"UP_LEFT0", Shape::Hex, 1, I_UP_LEFT0, UP_LEFT0_CORNERS, 2,
                    Pos{0, -1}, Span{A7, A9}, &LEFT0, &UP_RIGHT0};
const Wall UP_RIGHT0{"UP_RIGHT0", Shape::Hex, 2, I_UP_RIGHT0, UP_RIGHT0_CORNERS, 2,
                     Pos{1, -1}, Span{A9, A11}, &UP_LEFT0, &RIGHT0};
const Wall RIGHT0{"RIGHT0", Shape::Hex, 3, I_RIGHT0, RIGHT0_CORNERS, 2,
                  Pos{1, 0}, Span{A11, A1}, &UP_RIGHT0, &DOWN_RIGHT0};
const Wall DOWN_RIGHT0{"DOWN_RIGHT0", Shape::Hex, 4, I_DOWN_RIGHT0, DOWN_RIGHT0_CORNERS, 2,
                       Pos{1, 1}, Span{A1, A3}, &RIGHT0, &DOWN_LEFT0};
const Wall DOWN_LEFT0{"DOWN_LEFT0", Shape::Hex, 5, I_DOWN_LEFT0, DOWN_LEFT0_CORNERS, 2,
                      Pos{0, 1}, Span{A3, A5}, &DOWN_RIGHT0, &LEFT0};

// Linhas ímpares
const Wall LEFT1{"LEFT1", Shape::Hex, 0, I_LEFT1, LEFT1_CORNERS, 2,
                 Pos{-1, 0}, Span{A5, A7}, &DOWN_LEFT1, &UP_LEFT1};
const Wall UP_LEFT1{"UP_LEFT1", Shape::Hex, 1, I_UP_LEFT1, UP_LEFT1_CORNERS, 2,
                    Pos{-1, -1}, Span{A7, A9}, &LEFT1, &UP_RIGHT1};
const Wall UP_RIGHT1{"UP_RIGHT1", Shape::Hex, 2, I_UP_RIGHT1, UP_RIGHT1_CORNERS, 2,
                     Pos{0, -1}, Span{A9, A11}, &UP_LEFT1, &RIGHT1};
const Wall RIGHT1{"RIGHT1", Shape::Hex, 3, I_RIGHT1, RIGHT1_CORNERS, 2,
                  Pos{1, 0}, Span{A11, A1}, &UP_RIGHT1, &DOWN_RIGHT1};
const Wall DOWN_RIGHT1{"DOWN_RIGHT1", Shape::Hex, 4, I_DOWN_RIGHT1, DOWN_RIGHT1_CORNERS, 2,
                       Pos{0, 1}, Span{A1, A3}, &RIGHT1, &DOWN_LEFT1};
const Wall DOWN_LEFT1{"DOWN_LEFT1", Shape::Hex, 5, I_DOWN_LEFT1, DOWN_LEFT1_CORNERS, 2,
                      Pos{-1, 1}, Span{A3, A5}, &DOWN_RIGHT1, &LEFT1};

const std::vector<const Wall*>& all_walls() {
    static const std::vector<const Wall*> walls{
        &LEFT0, &RIGHT0, &LEFT1, &RIGHT1,
        &UP_LEFT0, &DOWN_RIGHT1, &UP_LEFT1, &DOWN_RIGHT0,
        &UP_RIGHT0, &DOWN_LEFT1, &UP_RIGHT1, &DOWN_LEFT0};
    return walls;
}

const std::vector<const Wall*>& walls(Pos pos) {
    static const std::vector<const Wall*> even{
        &LEFT0, &UP_LEFT0, &UP_RIGHT0, &RIGHT0, &DOWN_RIGHT0, &DOWN_LEFT0};
    static const std::vector<const Wall*> odd_row{
        &LEFT1, &UP_LEFT1, &UP_RIGHT1, &RIGHT1, &DOWN_RIGHT1, &DOWN_LEFT1};
    return odd(pos.row) ? odd_row : even;
}

WallIndex back_index(WallIndex index) {
    return index ^ 0b0001;
}

const Wall* opposite(const WallPos& wall_pos) {
    const WallIndex index = wall_pos.wall->index;
    // LEFT/RIGHT ficam na mesma variante; diagonais trocam de variante
    const WallIndex other = (index & ~WallIndex{0b0011}) == 0 ? index ^ 0b0001 : index ^ 0b0011;
    return all_walls()[other];
}

PhysicalPos center(Pos pos) {
    const float shift = odd(pos.row) ? 0.5f : 1.0f;
    return {(static_cast<float>(pos.col) + shift) * HORIZONTAL_MULTIPLICATOR,
            static_cast<float>(pos.row) * VERTICAL_MULTIPLICATOR + 1.0f};
}

Pos room_at(PhysicalPos pos) {
    const int row0 = partition((pos.y - 1.0f) / VERTICAL_MULTIPLICATOR).first;
    const int col0 = partition(pos.x / HORIZONTAL_MULTIPLICATOR).first;

    Pos best{col0, row0};
    float best_distance = std::numeric_limits<float>::max();
    for (int row = row0 - 1; row <= row0 + 2; ++row) {
        for (int col = col0 - 2; col <= col0 + 1; ++col) {
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
    const int rows = std::max(
        1, static_cast<int>(std::ceil((height - 0.5f) / VERTICAL_MULTIPLICATOR)));
    // Com mais de uma linha o deslocamento das linhas ímpares acrescenta meia sala
    const float cols_f = rows > 1 ? width / HORIZONTAL_MULTIPLICATOR - 0.5f
                                  : width / HORIZONTAL_MULTIPLICATOR;
    const int cols = std::max(1, static_cast<int>(std::ceil(cols_f)));
    return {cols, rows};
}

} // namespace hex
} // namespace polymaze
