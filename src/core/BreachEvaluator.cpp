#include "BreachEvaluator.hpp"
#include "Config.hpp"
#include "Log.hpp"
#include <algorithm>
#include <future>
#include <thread>
#include <vector>

namespace breach {

std::optional<int> BreachEvaluator::bestBreachDistance(const Grid& grid, const DistanceMap& start,
                                                       const DistanceMap& end, Position wall) {
    if (!grid.is_wall(wall)) return std::nullopt;
    std::optional<int> min_start;
    std::optional<int> min_end;
    for (const auto& m : kMoves) {
        Position n{ wall.row + m[0], wall.col + m[1] };
        if (!grid.is_floor(n)) continue;
        if (auto s = start.at(n)) { if (!min_start || *s < *min_start) min_start = *s; }
        if (auto e = end.at(n))   { if (!min_end   || *e < *min_end)   min_end = *e; }
    }
    if (!min_start || !min_end) return std::nullopt;
    return *min_start + *min_end + 1;
}

std::optional<BreachCandidate> BreachEvaluator::scan_range(const Grid& grid, const DistanceMap& start,
                                                           const DistanceMap& end, int first, int last) {
    std::optional<BreachCandidate> best;
    for (int i = first; i < last; ++i) {
        Position p = grid.position(i);
        if (grid.tile(p) != Tile::Wall) continue;
        auto total = bestBreachDistance(grid, start, end, p);
        // estritamente menor: mantém a primeira parede em caso de empate
        if (total && (!best || *total < best->total)) best = BreachCandidate{ p, *total };
    }
    return best;
}

std::optional<BreachCandidate> BreachEvaluator::scan(const Grid& grid, const DistanceMap& start,
                                                     const DistanceMap& end, bool parallel) {
    const int n = grid.size();
    int workers = 1;
    if (parallel && n >= BREACH_CFG_PARALLEL_MIN_TILES) {
        const int hw = static_cast<int>(std::thread::hardware_concurrency());
        workers = std::max(1, std::min(hw, BREACH_CFG_MAX_WORKERS));
    }
    if (workers == 1) return scan_range(grid, start, end, 0, n);

    const int chunk = (n + workers - 1) / workers;
    std::vector<std::future<std::optional<BreachCandidate>>> parts;
    parts.reserve(static_cast<size_t>(workers));
    for (int first = 0; first < n; first += chunk) {
        const int last = std::min(n, first + chunk);
        parts.push_back(std::async(std::launch::async, [&grid, &start, &end, first, last]() {
            return scan_range(grid, start, end, first, last);
        }));
    }
    BREACH_LOGD("SCAN", "%d fatias de ate %d tiles", (int)parts.size(), chunk);

    std::optional<BreachCandidate> best;
    for (auto& f : parts) {
        auto part = f.get();
        if (part && (!best || part->total < best->total)) best = part;
    }
    return best;
}

} // namespace breach
