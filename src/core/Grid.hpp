#pragma once
#include <vector>
#include <cstdint>
#include <optional>
#include <utility>

/**
 * @file Grid.hpp
 * @brief Representação imutável de um labirinto binário (piso/parede) em grade.
 */

namespace breach {

/** @brief Matriz bruta de entrada (linha-major): 0 = piso, 1 = parede. */
using Rows = std::vector<std::vector<int>>;

/** @brief Estado de um tile da grade. */
enum class Tile : uint8_t { Floor = 0, Wall = 1 };

/**
 * @brief Motivo pelo qual uma matriz de entrada foi rejeitada.
 */
enum class MazeDefect : uint8_t {
    None,    ///< Entrada válida
    Empty,   ///< Nenhuma linha ou nenhuma coluna
    Ragged,  ///< Linhas com comprimentos diferentes
    BadTile  ///< Valor diferente de 0/1
};

/** @brief Nome legível do defeito (para logs/CLI). */
inline const char* to_string(MazeDefect d) {
    switch (d) {
        case MazeDefect::None:    return "none";
        case MazeDefect::Empty:   return "empty maze";
        case MazeDefect::Ragged:  return "ragged rows";
        case MazeDefect::BadTile: return "tile value not 0/1";
    }
    return "unknown";
}

/**
 * @brief Posição (linha, coluna) na grade.
 *
 * Identidade única dos nós em todas as coleções: duas posições são o mesmo nó
 * se linha e coluna coincidem.
 */
struct Position {
    int row{0}; ///< Linha (0 = topo)
    int col{0}; ///< Coluna (0 = esquerda)
};

inline bool operator==(const Position& a, const Position& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

/** @brief Deslocamentos 4-direcionais: cima, esquerda, direita, baixo. */
constexpr int kMoves[4][2] = { {-1, 0}, {0, -1}, {0, 1}, {1, 0} };

/**
 * @brief Grade imutável do labirinto (altura x largura) com predicados de passagem.
 *
 * Só é construída através de `from_rows()`, que valida a entrada; depois de
 * criada não há operações de escrita.
 */
class Grid {
public:
    /**
     * @brief Valida a matriz bruta e constrói a grade.
     * @param rows matriz 0/1 linha-major
     * @param defect saída opcional com o motivo da rejeição (None em caso de sucesso)
     * @return grade construída ou std::nullopt se a entrada for malformada
     */
    static std::optional<Grid> from_rows(const Rows& rows, MazeDefect* defect = nullptr) {
        auto fail = [&](MazeDefect d) -> std::optional<Grid> { if (defect) *defect = d; return std::nullopt; };
        if (rows.empty() || rows.front().empty()) return fail(MazeDefect::Empty);
        const int h = static_cast<int>(rows.size());
        const int w = static_cast<int>(rows.front().size());
        std::vector<Tile> tiles;
        tiles.reserve(static_cast<size_t>(w) * static_cast<size_t>(h));
        for (const auto& r : rows) {
            if (static_cast<int>(r.size()) != w) return fail(MazeDefect::Ragged);
            for (int v : r) {
                if (v == 0) tiles.push_back(Tile::Floor);
                else if (v == 1) tiles.push_back(Tile::Wall);
                else return fail(MazeDefect::BadTile);
            }
        }
        if (defect) *defect = MazeDefect::None;
        return Grid(w, h, std::move(tiles));
    }

    /** @brief Retorna a largura (colunas). */
    int width() const { return w_; }
    /** @brief Retorna a altura (linhas). */
    int height() const { return h_; }
    /** @brief Quantidade total de tiles. */
    int size() const { return w_ * h_; }

    /** @brief Verifica se a posição está dentro dos limites. */
    bool in_bounds(Position p) const { return p.row>=0 && p.col>=0 && p.row<h_ && p.col<w_; }

    /** @brief Índice linear linha-major; requer `in_bounds(p)`. */
    int index(Position p) const { return p.row * w_ + p.col; }
    /** @brief Inverso de `index()`. */
    Position position(int idx) const { return Position{ idx / w_, idx % w_ }; }

    /** @brief Estado do tile; requer `in_bounds(p)`. */
    Tile tile(Position p) const { return tiles_[static_cast<size_t>(index(p))]; }
    /** @brief true se a posição está na grade e é piso. */
    bool is_floor(Position p) const { return in_bounds(p) && tile(p) == Tile::Floor; }
    /** @brief true se a posição está na grade e é parede. */
    bool is_wall(Position p) const { return in_bounds(p) && tile(p) == Tile::Wall; }

    /** @brief Número de tiles de parede. */
    int wall_count() const {
        int n = 0;
        for (Tile t : tiles_) if (t == Tile::Wall) ++n;
        return n;
    }

    /** @brief Reconstrói a matriz 0/1 (usado por I/O e simulador). */
    Rows rows() const {
        Rows out(static_cast<size_t>(h_), std::vector<int>(static_cast<size_t>(w_), 0));
        for (int r = 0; r < h_; ++r)
            for (int c = 0; c < w_; ++c)
                out[r][c] = tile({r, c}) == Tile::Wall ? 1 : 0;
        return out;
    }

private:
    Grid(int w, int h, std::vector<Tile> tiles) : w_(w), h_(h), tiles_(std::move(tiles)) {}

    int w_;                  ///< Largura em tiles
    int h_;                  ///< Altura em tiles
    std::vector<Tile> tiles_;///< Armazenamento linear (linha-major)
};

} // namespace breach
