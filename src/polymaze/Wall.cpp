/**
 * @file Wall.cpp
 * @brief Operações sobre descritores de parede.
 */
#include "Wall.hpp"

namespace polymaze {

bool Wall::in_span(float angle) const {
    const float n = normalized_angle(angle);
    if (span.start.a < span.end.a) {
        return span.start.a <= n && n < span.end.a;
    }
    return span.start.a <= n || n < span.end.a;
}

float Wall::span_width() const {
    const float w = span.end.a - span.start.a;
    return w > 0.0f ? w : w + RADIAN_BOUND;
}

bool operator==(const Wall& a, const Wall& b) {
    return a.shape == b.shape && a.index == b.index && a.dir == b.dir;
}

bool operator==(const WallPos& a, const WallPos& b) {
    if (a.pos != b.pos) return false;
    if (a.wall == b.wall) return true;
    if (!a.wall || !b.wall) return false;
    return *a.wall == *b.wall;
}

bool operator<(const WallPos& a, const WallPos& b) {
    if (a.pos != b.pos) return a.pos < b.pos;
    const WallIndex ia = a.wall ? a.wall->index : 0;
    const WallIndex ib = b.wall ? b.wall->index : 0;
    return ia < ib;
}

} // namespace polymaze
