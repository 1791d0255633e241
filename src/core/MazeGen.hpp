#pragma once
#include <algorithm>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>
#include "Grid.hpp"

/**
 * @file MazeGen.hpp
 * @brief Gerador de labirintos de tiles (DFS aleatório) para simulador e testes.
 */

namespace breach {

/**
 * @brief Gera um labirinto 0/1 determinístico para a semente dada.
 *
 * - Inicia com todos os tiles como parede.
 * - "Salas" ficam nas coordenadas pares; DFS iterativo a partir de (0,0)
 *   abre a sala vizinha e o tile entre elas.
 * - Derruba `extra_breaks` paredes aleatórias, criando atalhos.
 * - Força os dois cantos (0,0) e (h-1,w-1) a piso.
 *
 * @param h altura (>= 1)
 * @param w largura (>= 1)
 * @param seed semente do `std::mt19937`
 * @param extra_breaks paredes extras a remover após o DFS
 */
inline Rows generate_maze(int h, int w, uint32_t seed, int extra_breaks = 0) {
    if (h < 1) h = 1;
    if (w < 1) w = 1;
    Rows m(static_cast<size_t>(h), std::vector<int>(static_cast<size_t>(w), 1));
    std::mt19937 rng(seed);

    std::vector<uint8_t> vis(static_cast<size_t>(w * h), 0);
    auto idx = [&](int r, int c) { return static_cast<size_t>(r * w + c); };
    std::vector<Position> stack;
    stack.push_back({0, 0});
    vis[idx(0, 0)] = 1;
    m[0][0] = 0;
    while (!stack.empty()) {
        Position p = stack.back();
        std::vector<Position> nbrs;
        if (p.row >= 2 && !vis[idx(p.row - 2, p.col)]) nbrs.push_back({p.row - 2, p.col});
        if (p.col + 2 < w && !vis[idx(p.row, p.col + 2)]) nbrs.push_back({p.row, p.col + 2});
        if (p.row + 2 < h && !vis[idx(p.row + 2, p.col)]) nbrs.push_back({p.row + 2, p.col});
        if (p.col >= 2 && !vis[idx(p.row, p.col - 2)]) nbrs.push_back({p.row, p.col - 2});
        if (nbrs.empty()) { stack.pop_back(); continue; }
        std::shuffle(nbrs.begin(), nbrs.end(), rng);
        Position q = nbrs.front();
        // abre a sala e o tile entre as duas
        m[(p.row + q.row) / 2][(p.col + q.col) / 2] = 0;
        m[q.row][q.col] = 0;
        vis[idx(q.row, q.col)] = 1;
        stack.push_back(q);
    }

    if (extra_breaks > 0) {
        std::vector<Position> walls;
        for (int r = 0; r < h; ++r)
            for (int c = 0; c < w; ++c)
                if (m[r][c] == 1) walls.push_back({r, c});
        std::shuffle(walls.begin(), walls.end(), rng);
        const int n = std::min(extra_breaks, static_cast<int>(walls.size()));
        for (int i = 0; i < n; ++i) m[walls[i].row][walls[i].col] = 0;
    }

    m[0][0] = 0;
    m[h - 1][w - 1] = 0;
    return m;
}

} // namespace breach
