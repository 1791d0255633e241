/**
 * @file Solver.hpp
 * @brief Orquestração: duas buscas BFS, varredura de paredes e resultado tipado.
 */
#pragma once
#include <cstdint>
#include <optional>
#include "Grid.hpp"
#include "BreachEvaluator.hpp"

namespace breach {

/** @brief Resultado de uma chamada ao solver. */
enum class SolveStatus : uint8_t {
    Ok,          ///< `length` válido
    InvalidMaze, ///< Entrada malformada (ver `SolveResult::defect`)
    NoSolution   ///< Nenhuma parede única conecta os dois cantos
};

/** @brief Nome legível do status (para logs/CLI). */
inline const char* to_string(SolveStatus s) {
    switch (s) {
        case SolveStatus::Ok:          return "ok";
        case SolveStatus::InvalidMaze: return "invalid maze";
        case SolveStatus::NoSolution:  return "no solution";
    }
    return "unknown";
}

/** @brief Opções de execução do solver. */
struct SolverOptions {
    /**
     * Considera também o caminho só por piso entre os cantos (sem romper parede).
     * Desligado por padrão: toda solução atravessa exatamente uma parede.
     */
    bool direct_path{false};
    /** Executa as duas buscas e a varredura em tarefas paralelas. */
    bool parallel{false};
};

/**
 * @brief Resultado tipado de `Solver::solve`.
 *
 * `length` é o comprimento da rota em passos base 1 (tiles visitados, contando
 * início e fim); só tem significado quando `status == Ok`.
 */
struct SolveResult {
    SolveStatus status{SolveStatus::NoSolution};
    int length{0};
    std::optional<Position> breach{};   ///< Parede rompida (vazio na rota direta)
    MazeDefect defect{MazeDefect::None};///< Detalhe quando `InvalidMaze`

    bool ok() const { return status == SolveStatus::Ok; }
};

/**
 * @brief Solver sem estado do labirinto com rompimento de uma parede.
 */
class Solver {
public:
    /**
     * @brief Valida a matriz e resolve do canto superior esquerdo ao inferior direito.
     * @param maze matriz 0/1 (0 = piso, 1 = parede)
     * @param opt opções de execução
     */
    static SolveResult solve(const Rows& maze, const SolverOptions& opt = {});

    /** @brief Resolve sobre uma grade já validada, entre os cantos opostos. */
    static SolveResult solve(const Grid& grid, const SolverOptions& opt = {});

    /**
     * @brief Forma geral: rota de `a` até `b` rompendo uma parede.
     *
     * Trocar `a` e `b` não altera o comprimento retornado.
     */
    static SolveResult solveBetween(const Grid& grid, Position a, Position b, const SolverOptions& opt = {});
};

} // namespace breach
