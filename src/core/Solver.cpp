#include "Solver.hpp"
#include "FrontierEngine.hpp"
#include "Config.hpp"
#include "Log.hpp"
#include <future>

namespace breach {

SolveResult Solver::solve(const Rows& maze, const SolverOptions& opt) {
    MazeDefect defect = MazeDefect::None;
    auto grid = Grid::from_rows(maze, &defect);
    if (!grid) {
        BREACH_LOGW("SOLVE", "labirinto invalido: %s", to_string(defect));
        SolveResult r;
        r.status = SolveStatus::InvalidMaze;
        r.defect = defect;
        return r;
    }
    return solve(*grid, opt);
}

SolveResult Solver::solve(const Grid& grid, const SolverOptions& opt) {
    return solveBetween(grid, Position{0, 0}, Position{grid.height() - 1, grid.width() - 1}, opt);
}

/**
 * @brief Executa as três etapas: BFS de cada extremo, varredura de paredes, mínimo.
 *
 * Caso degenerado `a == b`: rota de um único tile (comprimento 1); se esse
 * tile for parede, ele é o tile rompido.
 */
SolveResult Solver::solveBetween(const Grid& grid, Position a, Position b, const SolverOptions& opt) {
    SolveResult r;
    if (!grid.in_bounds(a) || !grid.in_bounds(b)) {
        BREACH_LOGW("SOLVE", "extremos fora da grade");
        r.status = SolveStatus::InvalidMaze;
        return r;
    }
    if (a == b) {
        r.status = SolveStatus::Ok;
        r.length = 1;
        if (grid.is_wall(a)) r.breach = a;
        return r;
    }

    const bool par = opt.parallel && grid.size() >= BREACH_CFG_PARALLEL_MIN_TILES;
    std::optional<DistanceMap> from_a;
    std::optional<DistanceMap> from_b;
    if (par) {
        auto fa = std::async(std::launch::async, [&grid, a]() { return FrontierEngine::distancesFrom(grid, a); });
        auto fb = std::async(std::launch::async, [&grid, b]() { return FrontierEngine::distancesFrom(grid, b); });
        from_a = fa.get();
        from_b = fb.get();
    } else {
        from_a = FrontierEngine::distancesFrom(grid, a);
        from_b = FrontierEngine::distancesFrom(grid, b);
    }

    auto best = BreachEvaluator::scan(grid, *from_a, *from_b, par);
    if (best) {
        r.status = SolveStatus::Ok;
        r.length = best->total;
        r.breach = best->wall;
    }
    if (opt.direct_path) {
        if (auto direct = from_a->at(b); direct && (!best || *direct <= best->total)) {
            r.status = SolveStatus::Ok;
            r.length = *direct;
            r.breach.reset();
        }
    }

    if (r.ok()) {
        BREACH_LOGI("SOLVE", "%dx%d comprimento=%d parede=%s", grid.height(), grid.width(), r.length,
                    r.breach ? "sim" : "nao");
    } else {
        BREACH_LOGI("SOLVE", "%dx%d sem solucao com uma parede", grid.height(), grid.width());
    }
    return r;
}

} // namespace breach
