/**
 * @file tests/test_breach_evaluator.cpp
 * @brief Testes do avaliador de paredes: total por parede e desempate da varredura.
 */
#include "unity.h"
#include "core/BreachEvaluator.hpp"
#include "core/FrontierEngine.hpp"
#include "core/MazeGen.hpp"

using namespace breach;

void setUp() {}
void tearDown() {}

struct Maps {
    Grid grid;
    DistanceMap start;
    DistanceMap end;
};

static Maps maps_for(const Rows& rows) {
    auto g = Grid::from_rows(rows);
    TEST_ASSERT_TRUE_MESSAGE(g.has_value(), "fixture invalida");
    auto s = FrontierEngine::distancesFrom(*g, {0,0});
    auto e = FrontierEngine::distancesFrom(*g, {g->height()-1, g->width()-1});
    TEST_ASSERT_TRUE(s.has_value() && e.has_value());
    return Maps{ *g, *s, *e };
}

void test_wall_total_uses_min_of_each_side() {
    Maps m = maps_for({{0,1,0},{0,1,0},{0,0,0}});
    // (0,1): vizinhos (0,0) [s=1,e=5] e (0,2) [s=7,e=3] -> 1 + 3 + 1
    auto t01 = BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {0,1});
    TEST_ASSERT_TRUE(t01.has_value());
    TEST_ASSERT_EQUAL_INT(5, *t01);
    // (1,1): vizinhos (1,0) [s=2,e=4], (2,1) [s=4,e=2], (1,2) [s=6,e=2] -> 2 + 2 + 1
    auto t11 = BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {1,1});
    TEST_ASSERT_TRUE(t11.has_value());
    TEST_ASSERT_EQUAL_INT(5, *t11);
}

void test_wall_reached_from_one_side_only() {
    // a parede (0,1) só toca a região do início; (0,3) só a do fim
    Maps m = maps_for({{0,1,1,1,0},{0,1,1,1,0}});
    TEST_ASSERT_FALSE(BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {0,1}).has_value());
    TEST_ASSERT_FALSE(BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {0,3}).has_value());
    // (0,2) não tem vizinho de piso
    TEST_ASSERT_FALSE(BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {0,2}).has_value());
}

void test_floor_and_out_of_bounds_are_not_candidates() {
    Maps m = maps_for({{0,1,0},{0,0,0}});
    TEST_ASSERT_FALSE(BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {0,0}).has_value());
    TEST_ASSERT_FALSE(BreachEvaluator::bestBreachDistance(m.grid, m.start, m.end, {5,5}).has_value());
}

void test_scan_prefers_first_wall_on_tie() {
    Maps m = maps_for({{0,1,0},{0,1,0},{0,0,0}});
    auto best = BreachEvaluator::scan(m.grid, m.start, m.end);
    TEST_ASSERT_TRUE(best.has_value());
    TEST_ASSERT_EQUAL_INT(5, best->total);
    TEST_ASSERT_EQUAL_INT(0, best->wall.row);
    TEST_ASSERT_EQUAL_INT(1, best->wall.col);
}

void test_scan_without_walls() {
    Maps m = maps_for({{0,0},{0,0}});
    TEST_ASSERT_FALSE(BreachEvaluator::scan(m.grid, m.start, m.end).has_value());
}

void test_parallel_scan_matches_sequential() {
    // grade grande o bastante para ultrapassar BREACH_CFG_PARALLEL_MIN_TILES
    for (uint32_t seed = 40; seed < 43; ++seed) {
        Maps m = maps_for(generate_maze(81, 81, seed, 200));
        auto seq = BreachEvaluator::scan(m.grid, m.start, m.end, false);
        auto par = BreachEvaluator::scan(m.grid, m.start, m.end, true);
        TEST_ASSERT_EQUAL_INT(seq.has_value(), par.has_value());
        if (!seq) continue;
        TEST_ASSERT_EQUAL_INT(seq->total, par->total);
        TEST_ASSERT_TRUE(seq->wall == par->wall);
    }
}

int main(int argc, char** argv) {
    UNITY_BEGIN();
    RUN_TEST(test_wall_total_uses_min_of_each_side);
    RUN_TEST(test_wall_reached_from_one_side_only);
    RUN_TEST(test_floor_and_out_of_bounds_are_not_candidates);
    RUN_TEST(test_scan_prefers_first_wall_on_tie);
    RUN_TEST(test_scan_without_walls);
    RUN_TEST(test_parallel_scan_matches_sequential);
    return UNITY_END();
}
