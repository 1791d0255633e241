/**
 * @file tests/test_grid.cpp
 * @brief Testes de validação e acesso da `Grid` (vazio, irregular, valores inválidos).
 *
 * Como executar:
 * - Via CTest: `ctest -R test_grid`
 * - Ou executando o binário deste teste diretamente.
 */
#include "unity.h"
#include "core/Grid.hpp"

using namespace breach;

void setUp() {}
void tearDown() {}

void test_builds_from_valid_rows() {
    MazeDefect d = MazeDefect::BadTile;
    auto g = Grid::from_rows({{0,1,0},{0,1,0}}, &d);
    TEST_ASSERT_TRUE(g.has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::None, (uint8_t)d);
    TEST_ASSERT_EQUAL_INT(2, g->height());
    TEST_ASSERT_EQUAL_INT(3, g->width());
    TEST_ASSERT_EQUAL_INT(2, g->wall_count());
    TEST_ASSERT_TRUE(g->is_floor({0,0}));
    TEST_ASSERT_TRUE(g->is_wall({1,1}));
    TEST_ASSERT_FALSE(g->is_floor({1,1}));
}

void test_rejects_empty_maze() {
    MazeDefect d = MazeDefect::None;
    TEST_ASSERT_FALSE(Grid::from_rows({}, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::Empty, (uint8_t)d);

    // linhas sem colunas
    d = MazeDefect::None;
    TEST_ASSERT_FALSE(Grid::from_rows({{}, {}}, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::Empty, (uint8_t)d);
}

void test_rejects_ragged_rows() {
    MazeDefect d = MazeDefect::None;
    TEST_ASSERT_FALSE(Grid::from_rows({{0,0,0},{0,0}}, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::Ragged, (uint8_t)d);
}

void test_rejects_non_binary_tiles() {
    MazeDefect d = MazeDefect::None;
    TEST_ASSERT_FALSE(Grid::from_rows({{0,2},{0,0}}, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::BadTile, (uint8_t)d);
}

void test_bounds_and_indexing() {
    auto g = Grid::from_rows({{0,0,0,0},{0,1,0,0},{0,0,0,1}});
    TEST_ASSERT_TRUE(g.has_value());
    TEST_ASSERT_TRUE(g->in_bounds({2,3}));
    TEST_ASSERT_FALSE(g->in_bounds({3,0}));
    TEST_ASSERT_FALSE(g->in_bounds({0,-1}));
    // fora da grade não é piso nem parede
    TEST_ASSERT_FALSE(g->is_floor({-1,0}));
    TEST_ASSERT_FALSE(g->is_wall({0,4}));

    const Position p{2,1};
    TEST_ASSERT_EQUAL_INT(9, g->index(p));
    TEST_ASSERT_TRUE(g->position(9) == p);
}

void test_rows_reproduce_input() {
    const Rows in{{0,1,1},{1,0,0}};
    auto g = Grid::from_rows(in);
    TEST_ASSERT_TRUE(g.has_value());
    TEST_ASSERT_TRUE(g->rows() == in);
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_builds_from_valid_rows);
    RUN_TEST(test_rejects_empty_maze);
    RUN_TEST(test_rejects_ragged_rows);
    RUN_TEST(test_rejects_non_binary_tiles);
    RUN_TEST(test_bounds_and_indexing);
    RUN_TEST(test_rows_reproduce_input);
    return UNITY_END();
}
