#pragma once
#include <optional>
#include "Grid.hpp"
#include "DistanceMap.hpp"

/**
 * @file FrontierEngine.hpp
 * @brief BFS em largura (por níveis) sobre os tiles de piso de uma `Grid`.
 */

namespace breach {

/**
 * @brief Motor de fronteira BFS: distância mínima da origem a cada piso alcançável.
 */
class FrontierEngine {
public:
    /**
     * @brief Calcula as distâncias a partir de `origin`.
     *
     * A origem recebe passo 1 e cada anel de expansão soma 1. A expansão só
     * entra em tiles de piso, com vizinhança 4-direcional. A origem é usada
     * como está, mesmo que seja parede (só ela fica marcada nesse caso, junto
     * com o piso alcançável a partir dela).
     *
     * @param grid  grade do labirinto
     * @param origin posição inicial
     * @return mapa de distâncias, ou std::nullopt se `origin` estiver fora da grade
     */
    static std::optional<DistanceMap> distancesFrom(const Grid& grid, Position origin);
};

} // namespace breach
