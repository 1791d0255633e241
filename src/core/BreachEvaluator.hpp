#pragma once
#include <optional>
#include "Grid.hpp"
#include "DistanceMap.hpp"

/**
 * @file BreachEvaluator.hpp
 * @brief Avaliação de rotas que atravessam exatamente um tile de parede convertido.
 */

namespace breach {

/** @brief Melhor parede candidata encontrada numa varredura. */
struct BreachCandidate {
    Position wall{};  ///< Tile de parede a ser rompido
    int total{0};     ///< Comprimento da rota (passos, base 1)
};

/**
 * @brief Combina dois mapas de distância através de tiles de parede.
 */
class BreachEvaluator {
public:
    /**
     * @brief Melhor rota que passa pelo tile de parede `wall`.
     *
     * Considera os vizinhos 4-direcionais de piso dentro da grade. Toma o menor
     * valor de `start` entre eles e, independentemente, o menor valor de `end`;
     * o total é `minStart + minEnd + 1` (o +1 é o passo sobre a parede).
     *
     * @param grid  grade do labirinto
     * @param start distâncias a partir do canto inicial
     * @param end   distâncias a partir do canto final
     * @param wall  tile de parede candidato
     * @return total da rota, ou std::nullopt se algum lado não alcança a parede
     *         (ou se `wall` não for parede)
     */
    static std::optional<int> bestBreachDistance(const Grid& grid, const DistanceMap& start,
                                                 const DistanceMap& end, Position wall);

    /**
     * @brief Avalia todas as paredes e retorna a de menor total.
     *
     * Empate: vence a primeira parede em ordem linha-major, também no modo
     * paralelo (cada fatia reduz localmente e as fatias são reduzidas em ordem).
     *
     * @param parallel divide as paredes entre threads (somente leitura dos mapas)
     * @return melhor candidata, ou std::nullopt se nenhuma parede conecta os dois lados
     */
    static std::optional<BreachCandidate> scan(const Grid& grid, const DistanceMap& start,
                                               const DistanceMap& end, bool parallel = false);

private:
    /** @brief Reduz os tiles de índice [first,last) em ordem linha-major. */
    static std::optional<BreachCandidate> scan_range(const Grid& grid, const DistanceMap& start,
                                                     const DistanceMap& end, int first, int last);
};

} // namespace breach
