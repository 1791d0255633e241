/**
 * @file tests/test_maze_text.cpp
 * @brief Testes do formato texto: variantes de separadores, erros e arquivos de exemplo em maze/.
 *
 * O diretório de exemplos vem de `BREACH_FIXTURES` (definido pelo CTest);
 * sem a variável, usa `maze` relativo ao diretório atual.
 */
#include "unity.h"
#include "core/MazeText.hpp"
#include "core/Solver.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>

using namespace breach;
namespace fs = std::filesystem;

void setUp() {}
void tearDown() {}

static std::string fixture(const char* name) {
    const char* dir = std::getenv("BREACH_FIXTURES");
    return (fs::path(dir ? dir : "maze") / name).string();
}

void test_separator_variants_parse_the_same() {
    const Rows expected{{0,1,0},{1,0,0}};
    const char* inputs[] = {
        "0 1 0\n1 0 0\n",
        "010\n100\n",
        "0,1,0\n1,0,0\r\n",
        "[[0, 1, 0],\n [1, 0, 0]]\n",
        "# comentario\n\n0\t1\t0\n\n1 0 0\n",
    };
    for (const char* text : inputs) {
        std::istringstream in(text);
        auto rows = parse_maze_text(in);
        TEST_ASSERT_TRUE_MESSAGE(rows.has_value(), text);
        TEST_ASSERT_TRUE_MESSAGE(*rows == expected, text);
    }
}

void test_rejects_bad_characters() {
    std::istringstream in("0 1 0\n0 x 0\n");
    MazeDefect d = MazeDefect::None;
    TEST_ASSERT_FALSE(parse_maze_text(in, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::BadTile, (uint8_t)d);

    std::istringstream two("0 2\n");
    TEST_ASSERT_FALSE(parse_maze_text(two, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::BadTile, (uint8_t)d);
}

void test_rejects_ragged_and_empty_text() {
    MazeDefect d = MazeDefect::None;
    std::istringstream ragged("0 0 0\n0 0\n");
    TEST_ASSERT_FALSE(parse_maze_text(ragged, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::Ragged, (uint8_t)d);

    std::istringstream empty("# so comentario\n\n");
    TEST_ASSERT_FALSE(parse_maze_text(empty, &d).has_value());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)MazeDefect::Empty, (uint8_t)d);
}

void test_format_is_space_separated() {
    TEST_ASSERT_EQUAL_STRING("0 1\n1 0\n", format_maze_text({{0,1},{1,0}}).c_str());
}

void test_example_files_solve_to_known_lengths() {
    Rows rows;
    TEST_ASSERT_TRUE(load_maze_file(fixture("middle_column.txt"), &rows));
    SolveResult a = Solver::solve(rows);
    TEST_ASSERT_TRUE(a.ok());
    TEST_ASSERT_EQUAL_INT(5, a.length);

    TEST_ASSERT_TRUE(load_maze_file(fixture("serpentine.txt"), &rows));
    SolveResult b = Solver::solve(rows);
    TEST_ASSERT_TRUE(b.ok());
    TEST_ASSERT_EQUAL_INT(11, b.length);

    TEST_ASSERT_TRUE(load_maze_file(fixture("separated.txt"), &rows));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SolveStatus::NoSolution, (uint8_t)Solver::solve(rows).status);
}

void test_save_then_load_file() {
    const fs::path dir = fs::temp_directory_path() / "maze_breach_test";
    const fs::path file = dir / "sub" / "saved.txt";
    std::error_code ec;
    fs::remove_all(dir, ec);

    const Rows in{{0,1,1},{0,0,1},{1,0,0}};
    TEST_ASSERT_TRUE_MESSAGE(save_maze_file(file.string(), in), "save_maze_file deveria criar diretorios");
    Rows out;
    TEST_ASSERT_TRUE(load_maze_file(file.string(), &out));
    TEST_ASSERT_TRUE(in == out);
    fs::remove_all(dir, ec);
}

void test_missing_file_fails() {
    Rows rows;
    TEST_ASSERT_FALSE(load_maze_file(fixture("does_not_exist.txt"), &rows));
    TEST_ASSERT_FALSE(load_maze_file(fixture("middle_column.txt"), nullptr));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_separator_variants_parse_the_same);
    RUN_TEST(test_rejects_bad_characters);
    RUN_TEST(test_rejects_ragged_and_empty_text);
    RUN_TEST(test_format_is_space_separated);
    RUN_TEST(test_example_files_solve_to_known_lengths);
    RUN_TEST(test_save_then_load_file);
    RUN_TEST(test_missing_file_fails);
    return UNITY_END();
}
