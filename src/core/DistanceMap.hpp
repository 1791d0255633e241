#pragma once
#include <vector>
#include <optional>
#include "Grid.hpp"

/**
 * @file DistanceMap.hpp
 * @brief Mapa posição -> contagem de passos (base 1) produzido por uma busca BFS.
 */

namespace breach {

/**
 * @brief Distâncias a partir de uma origem, indexadas densamente por posição.
 *
 * Armazenamento linha-major com `w*h` inteiros; o valor 0 significa "não
 * alcançado" (contagens válidas começam em 1 na origem). Consulta e
 * pertinência são O(1).
 */
class DistanceMap {
public:
    DistanceMap(int w, int h) : w_(w), h_(h), steps_(static_cast<size_t>(w) * static_cast<size_t>(h), 0) {}

    int width() const { return w_; }
    int height() const { return h_; }

    /** @brief true se `p` foi alcançada pela busca. */
    bool contains(Position p) const { return in_range(p) && steps_[slot(p)] > 0; }

    /** @brief Contagem de passos até `p`, ou std::nullopt se inalcançada. */
    std::optional<int> at(Position p) const {
        if (!contains(p)) return std::nullopt;
        return steps_[slot(p)];
    }

    /**
     * @brief Atribui a distância de `p` somente se ainda não atribuída.
     * @return true se o valor foi gravado (primeira visita)
     */
    bool assign(Position p, int steps) {
        if (!in_range(p) || steps <= 0 || steps_[slot(p)] > 0) return false;
        steps_[slot(p)] = steps;
        ++reached_;
        return true;
    }

    /** @brief Quantidade de posições alcançadas. */
    int reached() const { return reached_; }

private:
    bool in_range(Position p) const { return p.row>=0 && p.col>=0 && p.row<h_ && p.col<w_; }
    size_t slot(Position p) const { return static_cast<size_t>(p.row * w_ + p.col); }

    int w_;
    int h_;
    int reached_{0};
    std::vector<int> steps_;
};

} // namespace breach
