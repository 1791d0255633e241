#include "FrontierEngine.hpp"
#include "Log.hpp"
#include <queue>

namespace breach {

/**
 * @brief Expansão BFS a partir da origem.
 *
 * A primeira atribuição de uma posição é final; redescobertas posteriores são
 * descartadas por `DistanceMap::assign()`. Como a fila é FIFO, os níveis são
 * processados em ordem e a primeira distância já é a mínima.
 */
std::optional<DistanceMap> FrontierEngine::distancesFrom(const Grid& grid, Position origin) {
    if (!grid.in_bounds(origin)) {
        BREACH_LOGW("BFS", "origem (%d,%d) fora da grade %dx%d", origin.row, origin.col, grid.height(), grid.width());
        return std::nullopt;
    }
    DistanceMap dist(grid.width(), grid.height());
    std::queue<Position> q;
    dist.assign(origin, 1);
    q.push(origin);

    while (!q.empty()) {
        Position p = q.front(); q.pop();
        const int next = *dist.at(p) + 1;
        for (const auto& m : kMoves) {
            Position n{ p.row + m[0], p.col + m[1] };
            if (!grid.is_floor(n)) continue;
            if (dist.assign(n, next)) q.push(n);
        }
    }
    BREACH_LOGD("BFS", "origem (%d,%d): %d tiles alcancados", origin.row, origin.col, dist.reached());
    return dist;
}

} // namespace breach
