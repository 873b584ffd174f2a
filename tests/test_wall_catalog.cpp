/**
 * @file tests/test_wall_catalog.cpp
 * @brief Consistência das tabelas de paredes dos três formatos.
 *
 * Valida índices, ordem angular, paredes de trás, partição dos intervalos
 * angulares, a regra dos cantos compartilhados e as paredes opostas.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_wall_catalog`
 * - Ou executando o binário deste teste diretamente.
 */
#include <cmath>
#include "unity.h"
#include "polymaze/Hex.hpp"
#include "polymaze/Quad.hpp"
#include "polymaze/Shape.hpp"
#include "polymaze/Tri.hpp"
#include "test_support.hpp"

using namespace polymaze;
using polymaze::test::for_each_shape;

void setUp() {}
void tearDown() {}

/// Salas suficientes para cobrir as duas paridades de linha e de coluna.
static std::vector<Pos> sample_rooms() {
    std::vector<Pos> rooms;
    for (int row = -1; row <= 2; ++row) {
        for (int col = -1; col <= 2; ++col) rooms.push_back(Pos{col, row});
    }
    return rooms;
}

static float distance(PhysicalPos a, PhysicalPos b) {
    return std::sqrt((a - b).value());
}

void test_catalog_is_indexed_by_wall_index() {
    TEST_ASSERT_EQUAL_UINT32(6, all_walls(Shape::Tri).size());
    TEST_ASSERT_EQUAL_UINT32(4, all_walls(Shape::Quad).size());
    TEST_ASSERT_EQUAL_UINT32(12, all_walls(Shape::Hex).size());

    for_each_shape([](Shape shape) {
        const auto& catalog = all_walls(shape);
        for (std::size_t i = 0; i < catalog.size(); ++i) {
            TEST_ASSERT_EQUAL_UINT32(i, catalog[i]->index);
            TEST_ASSERT_TRUE(catalog[i]->shape == shape);
            TEST_ASSERT_EQUAL_UINT32(1u << i, catalog[i]->mask());
        }
    });
}

void test_room_walls_are_in_angular_order() {
    for_each_shape([](Shape shape) {
        for (Pos pos : sample_rooms()) {
            const auto& room_walls = walls(shape, pos);
            const std::size_t n = room_walls.size();
            TEST_ASSERT_EQUAL_UINT32(wall_count(shape), n);
            for (std::size_t k = 0; k < n; ++k) {
                const Wall* wall = room_walls[k];
                TEST_ASSERT_EQUAL_UINT32(k, wall->ordinal);
                TEST_ASSERT_TRUE(wall->next == room_walls[(k + 1) % n]);
                TEST_ASSERT_TRUE(wall->previous == room_walls[(k + n - 1) % n]);
                // O fim de uma parede é o início da próxima
                TEST_ASSERT_EQUAL_FLOAT(wall->span.end.a, wall->next->span.start.a);
            }
        }
    });
}

void test_back_is_an_involution() {
    for_each_shape([](Shape shape) {
        for (Pos pos : sample_rooms()) {
            for (const Wall* wall : walls(shape, pos)) {
                const WallPos wp{pos, wall};
                const WallPos other = back(shape, wp);
                TEST_ASSERT_TRUE(other.pos == pos + wall->dir);
                TEST_ASSERT_TRUE(back(shape, other) == wp);

                bool found = false;
                for (const Wall* w : walls(shape, other.pos)) found = found || w == other.wall;
                TEST_ASSERT_TRUE_MESSAGE(found, "parede de tras nao pertence a sala vizinha");

                // Os dois lados compartilham a mesma aresta, percorrida em sentidos opostos
                const PhysicalPos c1 = center(shape, pos);
                const PhysicalPos c2 = center(shape, other.pos);
                TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f,
                    distance(c1 + wall->span.end, c2 + other.wall->span.start));
                TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f,
                    distance(c1 + wall->span.start, c2 + other.wall->span.end));
            }
        }
    });
}

void test_spans_partition_the_circle() {
    for_each_shape([](Shape shape) {
        for (Pos pos : sample_rooms()) {
            const auto& room_walls = walls(shape, pos);
            float total = 0.0f;
            for (const Wall* wall : room_walls) {
                total += wall->span_width();
                const float angle_inside = wall->span.start.a + 0.4f * wall->span_width();
                int hits = 0;
                for (const Wall* other : room_walls) {
                    if (other->in_span(angle_inside)) {
                        ++hits;
                        TEST_ASSERT_TRUE(other == wall);
                    }
                }
                TEST_ASSERT_EQUAL_INT(1, hits);
            }
            TEST_ASSERT_FLOAT_WITHIN(1e-4f, RADIAN_BOUND, total);

            for (float a = -3.0f; a < 9.0f; a += 0.0137f) {
                int hits = 0;
                for (const Wall* wall : room_walls) hits += wall->in_span(a) ? 1 : 0;
                TEST_ASSERT_EQUAL_INT(1, hits);
            }
        }
    });
}

void test_corner_walls_share_the_start_corner() {
    for_each_shape([](Shape shape) {
        for (Pos pos : sample_rooms()) {
            for (const Wall* wall : walls(shape, pos)) {
                const WallPos wp{pos, wall};
                const PhysicalPos corner = center(shape, pos) + wall->span.start;
                const auto shared = corner_walls(shape, wp);
                TEST_ASSERT_EQUAL_UINT32(wall->corner_wall_count + 1, shared.size());
                TEST_ASSERT_TRUE(shared.front() == wp);
                for (const WallPos& cw : shared) {
                    bool belongs = false;
                    for (const Wall* w : walls(shape, cw.pos)) belongs = belongs || w == cw.wall;
                    TEST_ASSERT_TRUE_MESSAGE(belongs, "parede de canto nao pertence a sala");
                    const PhysicalPos other = center(shape, cw.pos) + cw.wall->span.start;
                    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, distance(corner, other));
                }
            }
        }
    });
}

void test_corner_walls_quad_example() {
    const auto cw = corner_walls(Shape::Quad, WallPos{{1, 1}, &quad::UP});
    TEST_ASSERT_EQUAL_UINT32(4, cw.size());
    test::assert_wall_pos(WallPos{{1, 1}, &quad::UP}, cw[0]);
    test::assert_wall_pos(WallPos{{1, 0}, &quad::LEFT}, cw[1]);
    test::assert_wall_pos(WallPos{{0, 0}, &quad::DOWN}, cw[2]);
    test::assert_wall_pos(WallPos{{0, 1}, &quad::RIGHT}, cw[3]);
}

void test_opposite_walls() {
    for (Pos pos : sample_rooms()) {
        for (const Wall* wall : walls(Shape::Quad, pos)) {
            const WallPos wp{pos, wall};
            const Wall* o = opposite(Shape::Quad, wp);
            TEST_ASSERT_NOT_NULL(o);
            TEST_ASSERT_TRUE(o != wall);
            TEST_ASSERT_TRUE(opposite(Shape::Quad, WallPos{pos, o}) == wall);
            TEST_ASSERT_EQUAL_INT(-wall->dir.col, o->dir.col);
            TEST_ASSERT_EQUAL_INT(-wall->dir.row, o->dir.row);
        }
        for (const Wall* wall : walls(Shape::Hex, pos)) {
            const WallPos wp{pos, wall};
            const Wall* o = opposite(Shape::Hex, wp);
            TEST_ASSERT_NOT_NULL(o);
            bool same_room = false;
            for (const Wall* w : walls(Shape::Hex, pos)) same_room = same_room || w == o;
            TEST_ASSERT_TRUE(same_room);
            TEST_ASSERT_TRUE(opposite(Shape::Hex, WallPos{pos, o}) == wall);
            TEST_ASSERT_FLOAT_WITHIN(1e-4f, normalized_angle(wall->span.start.a + PI), o->span.start.a);
        }
        for (const Wall* wall : walls(Shape::Tri, pos)) {
            TEST_ASSERT_NULL(opposite(Shape::Tri, WallPos{pos, wall}));
        }
    }
}

void test_wall_equality_and_order() {
    TEST_ASSERT_TRUE(quad::LEFT == quad::LEFT);
    TEST_ASSERT_TRUE(quad::LEFT != quad::RIGHT);
    TEST_ASSERT_TRUE(quad::LEFT < quad::UP);
    TEST_ASSERT_TRUE(hex::LEFT0 != hex::LEFT1);
    TEST_ASSERT_TRUE((WallPos{{0, 0}, &quad::DOWN} < WallPos{{0, 1}, &quad::LEFT}));
    TEST_ASSERT_TRUE((WallPos{{0, 0}, &quad::LEFT} < WallPos{{0, 0}, &quad::UP}));
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_catalog_is_indexed_by_wall_index);
    RUN_TEST(test_room_walls_are_in_angular_order);
    RUN_TEST(test_back_is_an_involution);
    RUN_TEST(test_spans_partition_the_circle);
    RUN_TEST(test_corner_walls_share_the_start_corner);
    RUN_TEST(test_corner_walls_quad_example);
    RUN_TEST(test_opposite_walls);
    RUN_TEST(test_wall_equality_and_order);
    return UNITY_END();
}
