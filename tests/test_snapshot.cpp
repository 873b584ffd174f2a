/**
 * @file tests/test_snapshot.cpp
 * @brief Testes do snapshot binário das paredes (codificação, validação e restauração).
 *
 * Como executar:
 * - Via CTest: `ctest -R test_snapshot`
 * - Ou executando o binário deste teste diretamente.
 */
#include "unity.h"
#include "polymaze/Quad.hpp"
#include "polymaze/Randomizer.hpp"
#include "polymaze/Snapshot.hpp"
#include "polymaze/initialize/Initialize.hpp"
#include "test_support.hpp"

using namespace polymaze;
using polymaze::test::for_each_shape;

void setUp() {}
void tearDown() {}

static void assert_same_walls(const Maze<>& expected, const Maze<>& actual) {
    TEST_ASSERT_TRUE(expected.shape() == actual.shape());
    TEST_ASSERT_EQUAL_INT(expected.width(), actual.width());
    TEST_ASSERT_EQUAL_INT(expected.height(), actual.height());
    for (Pos pos : expected.positions()) {
        TEST_ASSERT_EQUAL_UINT32(expected[pos].mask(), actual[pos].mask());
        TEST_ASSERT_EQUAL(expected[pos].visited, actual[pos].visited);
    }
}

void test_header_layout() {
    const Maze<> maze(Shape::Hex, 3, 2);
    const auto bytes = encode_snapshot(maze);
    TEST_ASSERT_EQUAL_UINT32(SNAPSHOT_HEADER_SIZE + 2 * 6, bytes.size());

    const uint8_t header[] = {
        0x53, 0x5A, 0x4D, 0x50, // magic
        0x01, 0x00,             // versão
        6, 0,                   // formato, reservado
        3, 0, 2, 0,             // largura, altura
        12, 0, 0, 0,            // payload
    };
    TEST_ASSERT_EQUAL_HEX8_ARRAY(header, bytes.data(), 16);
}

void test_round_trip_of_generated_mazes() {
    for_each_shape([](Shape shape) {
        Maze<> maze(shape, 9, 6);
        Lfsr rng(17);
        initialize_filter(maze, Method{Method::Kind::Winding, {}}, rng,
                          [](Pos p) { return p.col < 7; });
        // Uma passagem para fora da grade também é preservada
        maze.open(WallPos{{0, 0}, maze.walls({0, 0}).front()});

        const auto bytes = encode_snapshot(maze);
        const auto decoded = decode_snapshot<int>(bytes);
        TEST_ASSERT_TRUE(decoded.has_value());
        assert_same_walls(maze, *decoded);
        TEST_ASSERT_FALSE((decoded->rooms()[Pos{8, 0}].visited));
    });
}

void test_restore_keeps_room_data() {
    auto maze = Maze<int>::with_data(Shape::Quad, 4, 4, [](Pos p) { return p.col + 4 * p.row; });
    Lfsr rng(3);
    initialize(maze, Method{Method::Kind::Branching, {}}, rng);
    const Maze<> reference = maze;
    const auto bytes = encode_snapshot(maze);

    // Estado diferente antes de restaurar
    initialize(maze, Method{Method::Kind::Clear, {}}, rng);
    TEST_ASSERT_TRUE(restore_snapshot(maze, bytes));
    assert_same_walls(reference, maze);
    TEST_ASSERT_EQUAL_INT(14, *maze.data({2, 3}));
}

void test_restore_rejects_other_mazes() {
    Maze<> quad(Shape::Quad, 3, 3);
    test::Navigator(quad, {0, 0}).right().down();
    const auto bytes = encode_snapshot(quad);

    Maze<> hex(Shape::Hex, 3, 3);
    Maze<> wider(Shape::Quad, 4, 3);
    TEST_ASSERT_FALSE(restore_snapshot(hex, bytes));
    TEST_ASSERT_FALSE(restore_snapshot(wider, bytes));
    for (Pos pos : wider.positions()) TEST_ASSERT_EQUAL_UINT32(0, wider[pos].mask());
}

void test_rejects_corrupted_buffers() {
    Maze<> maze(Shape::Quad, 2, 1);
    const auto good = encode_snapshot(maze);
    TEST_ASSERT_TRUE(parse_snapshot(good).has_value());

    TEST_ASSERT_FALSE(parse_snapshot(std::vector<uint8_t>(good.begin(), good.begin() + 10)).has_value());
    TEST_ASSERT_FALSE(parse_snapshot(std::vector<uint8_t>(good.begin(), good.end() - 1)).has_value());

    auto extra = good;
    extra.push_back(0);
    TEST_ASSERT_FALSE(parse_snapshot(extra).has_value());

    auto magic = good;
    magic[0] = 'X';
    TEST_ASSERT_FALSE(parse_snapshot(magic).has_value());

    auto version = good;
    version[4] = 2;
    TEST_ASSERT_FALSE(parse_snapshot(version).has_value());

    auto shape = good;
    shape[6] = 5;
    TEST_ASSERT_FALSE(parse_snapshot(shape).has_value());

    auto size = good;
    size[12] = 6;
    TEST_ASSERT_FALSE(parse_snapshot(size).has_value());
}

void test_rejects_inconsistent_records() {
    Maze<> maze(Shape::Quad, 2, 1);
    const auto good = encode_snapshot(maze);

    // Parede aberta só de um lado
    auto asymmetric = good;
    asymmetric[SNAPSHOT_HEADER_SIZE] = static_cast<uint8_t>(quad::RIGHT.mask());
    TEST_ASSERT_FALSE(parse_snapshot(asymmetric).has_value());
    TEST_ASSERT_FALSE(decode_snapshot<int>(asymmetric).has_value());

    // Bit de uma parede que uma sala quadrada não tem
    auto foreign = good;
    foreign[SNAPSHOT_HEADER_SIZE + 1] = 0x04;
    TEST_ASSERT_FALSE(parse_snapshot(foreign).has_value());

    // Os dois lados abertos formam um registro válido
    auto both = good;
    both[SNAPSHOT_HEADER_SIZE] = static_cast<uint8_t>(quad::RIGHT.mask());
    both[SNAPSHOT_HEADER_SIZE + 2] = static_cast<uint8_t>(quad::LEFT.mask());
    both[SNAPSHOT_HEADER_SIZE + 3] = 0x80; // visitada
    const auto decoded = decode_snapshot<int>(both);
    TEST_ASSERT_TRUE(decoded.has_value());
    TEST_ASSERT_TRUE(decoded->connected({0, 0}, {1, 0}));
    TEST_ASSERT_TRUE((decoded->rooms()[Pos{1, 0}].visited));
    TEST_ASSERT_FALSE((decoded->rooms()[Pos{0, 0}].visited));
}

void test_encode_rejects_wrong_record_count() {
    TEST_ASSERT_EQUAL_UINT32(0, encode_snapshot_records(Shape::Quad, 2, 2, {0, 0, 0}).size());
    TEST_ASSERT_EQUAL_UINT32(0, encode_snapshot_records(Shape::Quad, -1, 2, {}).size());
    TEST_ASSERT_EQUAL_UINT32(SNAPSHOT_HEADER_SIZE, encode_snapshot_records(Shape::Tri, 0, 0, {}).size());
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_header_layout);
    RUN_TEST(test_round_trip_of_generated_mazes);
    RUN_TEST(test_restore_keeps_room_data);
    RUN_TEST(test_restore_rejects_other_mazes);
    RUN_TEST(test_rejects_corrupted_buffers);
    RUN_TEST(test_rejects_inconsistent_records);
    RUN_TEST(test_encode_rejects_wrong_record_count);
    return UNITY_END();
}
