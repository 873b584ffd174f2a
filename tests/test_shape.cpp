/**
 * @file tests/test_shape.cpp
 * @brief Testes do despacho por formato: nomes, centros, busca inversa,
 *        caixas de visualização e dimensões mínimas.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_shape`
 * - Ou executando o binário deste teste diretamente.
 */
#include <algorithm>
#include "unity.h"
#include "polymaze/Maze.hpp"
#include "polymaze/Quad.hpp"
#include "test_support.hpp"

using namespace polymaze;
using polymaze::test::for_each_shape;

void setUp() {}
void tearDown() {}

void test_shape_names_and_tags() {
    TEST_ASSERT_TRUE(shape_from_walls(3) == Shape::Tri);
    TEST_ASSERT_TRUE(shape_from_walls(4) == Shape::Quad);
    TEST_ASSERT_TRUE(shape_from_walls(6) == Shape::Hex);
    TEST_ASSERT_FALSE(shape_from_walls(0).has_value());
    TEST_ASSERT_FALSE(shape_from_walls(5).has_value());
    TEST_ASSERT_FALSE(shape_from_walls(8).has_value());

    for_each_shape([](Shape shape) {
        const auto parsed = shape_from_name(shape_name(shape));
        TEST_ASSERT_TRUE(parsed.has_value());
        TEST_ASSERT_TRUE(*parsed == shape);
        TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(shape), wall_count(shape));
    });
    TEST_ASSERT_EQUAL_STRING("hex", shape_name(Shape::Hex));
    TEST_ASSERT_FALSE(shape_from_name("penta").has_value());
    TEST_ASSERT_FALSE(shape_from_name("").has_value());
}

void test_room_at_inverts_center() {
    for_each_shape([](Shape shape) {
        for (int row = -2; row < 6; ++row) {
            for (int col = -2; col < 6; ++col) {
                const Pos pos{col, row};
                const PhysicalPos c = center(shape, pos);
                TEST_ASSERT_TRUE(room_at(shape, c) == pos);
                // Pontos próximos dos cantos ainda pertencem à sala
                for (const Wall* wall : walls(shape, pos)) {
                    const PhysicalPos near_corner = c + PhysicalPos{wall->span.start.dx, wall->span.start.dy} * 0.6f;
                    TEST_ASSERT_TRUE(room_at(shape, near_corner) == pos);
                }
            }
        }
    });
}

void test_wall_pos_at_finds_the_wall_under_the_point() {
    for_each_shape([](Shape shape) {
        for (int row = 0; row < 4; ++row) {
            for (int col = 0; col < 4; ++col) {
                const Pos pos{col, row};
                const PhysicalPos c = center(shape, pos);
                for (const Wall* wall : walls(shape, pos)) {
                    const PhysicalPos mid = (PhysicalPos{wall->span.start.dx, wall->span.start.dy}
                                           + PhysicalPos{wall->span.end.dx, wall->span.end.dy}) * 0.45f;
                    const WallPos found = wall_pos_at(shape, c + mid);
                    TEST_ASSERT_TRUE(found.pos == pos);
                    TEST_ASSERT_EQUAL_STRING(wall->name, found.wall->name);
                }
            }
        }
    });
}

void test_quad_viewbox() {
    const ViewBox box = viewbox(Shape::Quad, 3, 2);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, box.corner.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, box.corner.y);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 3.0f * 1.41421356f, box.width);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 2.0f * 1.41421356f, box.height);

    TEST_ASSERT_TRUE(viewbox(Shape::Hex, 0, 5) == ViewBox{});
    TEST_ASSERT_TRUE(viewbox(Shape::Tri, 4, -1) == ViewBox{});

    const Maze<> maze(Shape::Quad, 3, 2);
    TEST_ASSERT_TRUE(maze.viewbox() == box);
}

void test_minimal_dimensions_cover_the_area() {
    for_each_shape([](Shape shape) {
        for (int i = 1; i <= 24; ++i) {
            for (int j = 1; j <= 24; ++j) {
                const float w = 0.5f * static_cast<float>(i);
                const float h = 0.5f * static_cast<float>(j);
                const auto dims = minimal_dimensions(shape, w, h);
                TEST_ASSERT_TRUE(dims.first >= 1 && dims.second >= 1);

                const Maze<> fits(shape, dims.first, dims.second);
                TEST_ASSERT_TRUE(fits.viewbox().width >= w - 1e-4f);
                TEST_ASSERT_TRUE(fits.viewbox().height >= h - 1e-4f);

                if (dims.first > 1 && dims.second > 1) {
                    const Maze<> smaller(shape, dims.first - 1, dims.second - 1);
                    TEST_ASSERT_TRUE(smaller.viewbox().width <= w + 1e-4f);
                    TEST_ASSERT_TRUE(smaller.viewbox().height <= h + 1e-4f);
                }
            }
        }
    });
}

void test_rooms_touched_by_a_tiny_box() {
    const Maze<> maze(Shape::Quad, 5, 4);
    const ViewBox box = ViewBox::centered_at(maze.center({2, 1}), 0.1f, 0.1f);
    const auto rooms = maze.rooms_touched_by(box);
    TEST_ASSERT_EQUAL_UINT32(1, rooms.size());
    TEST_ASSERT_TRUE(rooms[0] == (Pos{2, 1}));
}

void test_rooms_touched_by_the_first_row() {
    const Maze<> maze(Shape::Quad, 4, 3);
    const float m = maze.center({1, 1}).x - maze.center({0, 1}).x;
    const ViewBox box{{0.1f, 0.1f}, 4.0f * m - 0.2f, 0.8f * m};
    auto rooms = maze.rooms_touched_by(box);
    std::sort(rooms.begin(), rooms.end(), [](Pos a, Pos b) { return a.col < b.col; });
    TEST_ASSERT_EQUAL_UINT32(4, rooms.size());
    for (int col = 0; col < 4; ++col) {
        TEST_ASSERT_EQUAL_INT(col, rooms[static_cast<std::size_t>(col)].col);
        TEST_ASSERT_EQUAL_INT(0, rooms[static_cast<std::size_t>(col)].row);
    }
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_shape_names_and_tags);
    RUN_TEST(test_room_at_inverts_center);
    RUN_TEST(test_wall_pos_at_finds_the_wall_under_the_point);
    RUN_TEST(test_quad_viewbox);
    RUN_TEST(test_minimal_dimensions_cover_the_area);
    RUN_TEST(test_rooms_touched_by_a_tiny_box);
    RUN_TEST(test_rooms_touched_by_the_first_row);
    return UNITY_END();
}
