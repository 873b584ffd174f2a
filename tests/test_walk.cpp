/**
 * @file tests/test_walk.cpp
 * @brief Testes da busca de caminho (A*) sobre as paredes abertas.
 *
 * Como executar:
 * - Via CTest: `ctest -R test_walk`
 * - Ou executando o binário deste teste diretamente.
 */
#include <set>
#include "unity.h"
#include "polymaze/Maze.hpp"
#include "polymaze/Randomizer.hpp"
#include "polymaze/Walk.hpp"
#include "polymaze/initialize/Initialize.hpp"
#include "test_support.hpp"

using namespace polymaze;
using polymaze::test::for_each_shape;

void setUp() {}
void tearDown() {}

static void assert_valid_path(const Maze<>& maze, const Path& path, Pos from, Pos to) {
    const auto rooms = path.to_vector();
    TEST_ASSERT_TRUE(rooms.size() >= 1);
    TEST_ASSERT_TRUE(rooms.front() == from);
    TEST_ASSERT_TRUE(rooms.back() == to);
    std::set<Pos> seen;
    for (std::size_t i = 0; i < rooms.size(); ++i) {
        TEST_ASSERT_TRUE_MESSAGE(seen.insert(rooms[i]).second, "sala repetida no caminho");
        if (i > 0) TEST_ASSERT_TRUE(maze.connected(rooms[i - 1], rooms[i]));
    }
}

void test_walk_to_self() {
    const Maze<> maze(Shape::Hex, 3, 3);
    const auto path = walk(maze, {1, 1}, {1, 1});
    TEST_ASSERT_TRUE(path.has_value());
    const auto rooms = path->to_vector();
    TEST_ASSERT_EQUAL_UINT32(1, rooms.size());
    TEST_ASSERT_TRUE(rooms[0] == (Pos{1, 1}));
}

void test_walk_without_connection() {
    Maze<> maze(Shape::Quad, 4, 4);
    test::Navigator(maze, {0, 0}).right().down();
    TEST_ASSERT_FALSE(walk(maze, {0, 0}, {3, 3}).has_value());
    TEST_ASSERT_TRUE(walk(maze, {0, 0}, {1, 1}).has_value());
}

void test_walk_outside_the_grid() {
    Maze<> maze(Shape::Quad, 2, 2);
    test::Navigator(maze, {0, 0}).right().down().left();
    TEST_ASSERT_FALSE(walk(maze, {0, 0}, {2, 0}).has_value());
    TEST_ASSERT_FALSE(walk(maze, {-1, 0}, {1, 1}).has_value());
}

void test_walk_follows_the_only_corridor() {
    // Serpentina: toda a primeira linha, desce, volta pela segunda linha
    Maze<> maze(Shape::Quad, 4, 3);
    test::Navigator nav(maze, {0, 0});
    nav.right().right().right().down().left().left().left().down().right();

    const auto path = walk(maze, {0, 0}, {1, 2});
    TEST_ASSERT_TRUE(path.has_value());
    const auto rooms = path->to_vector();
    TEST_ASSERT_EQUAL_UINT32(nav.rooms().size(), rooms.size());
    for (std::size_t i = 0; i < rooms.size(); ++i) {
        TEST_ASSERT_TRUE(rooms[i] == nav.rooms()[i]);
    }

    // Sentido inverso percorre as mesmas salas ao contrário
    const auto reverse = walk(maze, {1, 2}, {0, 0})->to_vector();
    TEST_ASSERT_EQUAL_UINT32(rooms.size(), reverse.size());
    for (std::size_t i = 0; i < rooms.size(); ++i) {
        TEST_ASSERT_TRUE(reverse[i] == rooms[rooms.size() - 1 - i]);
    }
}

void test_walk_prefers_the_short_way() {
    // Anel 3x3 aberto ao redor do centro: os dois caminhos de (0,0) até (2,0)
    Maze<> maze(Shape::Quad, 3, 3);
    test::Navigator(maze, {0, 0}).right().right().down().down().left().left().up().up();
    const auto path = walk(maze, {0, 0}, {2, 0});
    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_EQUAL_UINT32(3, path->to_vector().size());
}

void test_walk_on_generated_mazes() {
    for_each_shape([](Shape shape) {
        Maze<> maze(shape, 9, 7);
        Lfsr rng(2024);
        initialize(maze, Method{Method::Kind::Branching, {}}, rng);

        const Pos from{0, 0};
        const Pos to{maze.width() - 1, maze.height() - 1};
        const auto path = walk(maze, from, to);
        TEST_ASSERT_TRUE(path.has_value());
        assert_valid_path(maze, *path, from, to);

        // O caminho pode ser percorrido mais de uma vez
        std::size_t first = 0;
        std::size_t second = 0;
        for (Pos p : *path) { (void)p; ++first; }
        for (Pos p : *path) { (void)p; ++second; }
        TEST_ASSERT_EQUAL_UINT32(first, second);
        TEST_ASSERT_TRUE(path->from() == from);
        TEST_ASSERT_TRUE(path->to() == to);
    });
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_walk_to_self);
    RUN_TEST(test_walk_without_connection);
    RUN_TEST(test_walk_outside_the_grid);
    RUN_TEST(test_walk_follows_the_only_corridor);
    RUN_TEST(test_walk_prefers_the_short_way);
    RUN_TEST(test_walk_on_generated_mazes);
    return UNITY_END();
}
