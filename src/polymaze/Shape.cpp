/**
 * @file Shape.cpp
 * @brief Despacho por formato e operações derivadas do catálogo de paredes.
 */
#include "Shape.hpp"
#include <cmath>
#include "Hex.hpp"
#include "Quad.hpp"
#include "Tri.hpp"

namespace polymaze {

std::optional<Shape> shape_from_walls(uint32_t walls) {
    switch (walls) {
        case 3: return Shape::Tri;
        case 4: return Shape::Quad;
        case 6: return Shape::Hex;
        default: return std::nullopt;
    }
}

std::optional<Shape> shape_from_name(const std::string& name) {
    if (name == "tri") return Shape::Tri;
    if (name == "quad") return Shape::Quad;
    if (name == "hex") return Shape::Hex;
    return std::nullopt;
}

const char* shape_name(Shape shape) {
    switch (shape) {
        case Shape::Tri: return "tri";
        case Shape::Quad: return "quad";
        case Shape::Hex: return "hex";
    }
    return "?";
}

std::size_t wall_count(Shape shape) {
    return static_cast<std::size_t>(shape);
}

const std::vector<const Wall*>& all_walls(Shape shape) {
    switch (shape) {
        case Shape::Tri: return tri::all_walls();
        case Shape::Hex: return hex::all_walls();
        case Shape::Quad: break;
    }
    return quad::all_walls();
}

const std::vector<const Wall*>& walls(Shape shape, Pos pos) {
    switch (shape) {
        case Shape::Tri: return tri::walls(pos);
        case Shape::Hex: return hex::walls(pos);
        case Shape::Quad: break;
    }
    return quad::walls(pos);
}

WallPos back(Shape shape, const WallPos& wall_pos) {
    WallIndex index = 0;
    switch (shape) {
        case Shape::Tri: index = tri::back_index(wall_pos.wall->index); break;
        case Shape::Quad: index = quad::back_index(wall_pos.wall->index); break;
        case Shape::Hex: index = hex::back_index(wall_pos.wall->index); break;
    }
    return WallPos{wall_pos.pos + wall_pos.wall->dir, all_walls(shape)[index]};
}

const Wall* opposite(Shape shape, const WallPos& wall_pos) {
    switch (shape) {
        case Shape::Tri: return tri::opposite(wall_pos);
        case Shape::Hex: return hex::opposite(wall_pos);
        case Shape::Quad: break;
    }
    return quad::opposite(wall_pos);
}

PhysicalPos center(Shape shape, Pos pos) {
    switch (shape) {
        case Shape::Tri: return tri::center(pos);
        case Shape::Hex: return hex::center(pos);
        case Shape::Quad: break;
    }
    return quad::center(pos);
}

Pos room_at(Shape shape, PhysicalPos pos) {
    switch (shape) {
        case Shape::Tri: return tri::room_at(pos);
        case Shape::Hex: return hex::room_at(pos);
        case Shape::Quad: break;
    }
    return quad::room_at(pos);
}

WallPos wall_pos_at(Shape shape, PhysicalPos pos) {
    const Pos room = room_at(shape, pos);
    const PhysicalPos c = center(shape, room);
    const float angle = std::atan2(pos.y - c.y, pos.x - c.x);
    const auto& room_walls = walls(shape, room);
    for (const Wall* wall : room_walls) {
        if (wall->in_span(angle)) return WallPos{room, wall};
    }
    // Os intervalos cobrem [0, 2π); só um ângulo NaN chega aqui
    return WallPos{room, room_walls.front()};
}

std::pair<int, int> minimal_dimensions(Shape shape, float width, float height) {
    switch (shape) {
        case Shape::Tri: return tri::minimal_dimensions(width, height);
        case Shape::Hex: return hex::minimal_dimensions(width, height);
        case Shape::Quad: break;
    }
    return quad::minimal_dimensions(width, height);
}

ViewBox viewbox(Shape shape, int cols, int rows) {
    if (cols <= 0 || rows <= 0) return ViewBox{};
    // As colunas extremas de cada linha bastam para alcançar os cantos externos
    std::vector<PhysicalPos> corners;
    for (int row = 0; row < rows; ++row) {
        for (int col : {0, cols - 1}) {
            const Pos pos{col, row};
            const PhysicalPos c = center(shape, pos);
            for (const Wall* wall : walls(shape, pos)) {
                corners.push_back(c + wall->span.start);
            }
        }
    }
    return ViewBox::enclosing(corners.begin(), corners.end());
}

std::vector<WallPos> corner_walls(Shape shape, const WallPos& wall_pos) {
    std::vector<WallPos> result;
    result.reserve(wall_pos.wall->corner_wall_count + 1);
    result.push_back(wall_pos);
    const auto& catalog = all_walls(shape);
    for (const Offset* o = wall_pos.wall->corners_begin(); o != wall_pos.wall->corners_end(); ++o) {
        result.push_back(WallPos{wall_pos.pos + Pos{o->dx, o->dy}, catalog[o->wall]});
    }
    return result;
}

std::vector<Pos> surround(Pos pos, int distance) {
    if (distance <= 0) return {pos};
    std::vector<Pos> ring;
    ring.reserve(static_cast<std::size_t>(8 * distance));
    const int left = pos.col - distance;
    const int right = pos.col + distance;
    const int top = pos.row - distance;
    const int bottom = pos.row + distance;
    for (int col = left; col < right; ++col) ring.push_back(Pos{col, top});
    for (int row = top; row < bottom; ++row) ring.push_back(Pos{right, row});
    for (int col = right; col > left; --col) ring.push_back(Pos{col, bottom});
    for (int row = bottom; row > top; --row) ring.push_back(Pos{left, row});
    return ring;
}

} // namespace polymaze
