/**
 * @file cli/main.cpp
 * @brief Linha de comando: lê um labirinto 0/1 e imprime o comprimento da rota rompendo uma parede.
 *
 * Uso:
 *   maze_breach [--direct] [--parallel] [--quiet] [--help] <arquivo|->
 *
 * - `--direct`: aceita também a rota só por piso (sem romper parede).
 * - `--parallel`: buscas e varredura em tarefas paralelas.
 * - `--quiet`: imprime apenas o número.
 * - `-`: lê o labirinto de stdin.
 *
 * Código de saída: 0 = ok, 2 = sem solução, 1 = entrada inválida/uso incorreto.
 */
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include "core/MazeText.hpp"
#include "core/Solver.hpp"
#include "core/Log.hpp"

using namespace breach;

static void usage(const char* argv0) {
    std::printf("Usage: %s [--direct] [--parallel] [--quiet] <maze.txt|->\n", argv0);
}

int main(int argc, char** argv) {
    SolverOptions opt{};
    bool quiet = false;
    const char* input = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (!std::strcmp(argv[i], "--direct")) opt.direct_path = true;
        else if (!std::strcmp(argv[i], "--parallel")) opt.parallel = true;
        else if (!std::strcmp(argv[i], "--quiet")) quiet = true;
        else if (!std::strcmp(argv[i], "--help")) { usage(argv[0]); return 0; }
        else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            BREACH_LOGE("CLI", "opcao desconhecida %s", argv[i]);
            usage(argv[0]);
            return 1;
        }
        else input = argv[i];
    }
    if (!input) { usage(argv[0]); return 1; }

    Rows rows;
    MazeDefect defect = MazeDefect::None;
    if (!std::strcmp(input, "-")) {
        auto parsed = parse_maze_text(std::cin, &defect);
        if (!parsed) {
            BREACH_LOGE("CLI", "stdin invalido: %s", to_string(defect));
            return 1;
        }
        rows = std::move(*parsed);
    } else if (!load_maze_file(input, &rows, &defect)) {
        return 1;
    }

    const SolveResult r = Solver::solve(rows, opt);
    switch (r.status) {
        case SolveStatus::Ok:
            if (quiet) {
                std::printf("%d\n", r.length);
            } else if (r.breach) {
                std::printf("%d (breach at row=%d col=%d)\n", r.length, r.breach->row, r.breach->col);
            } else {
                std::printf("%d (no breach)\n", r.length);
            }
            return 0;
        case SolveStatus::NoSolution:
            if (!quiet) std::printf("no solution\n");
            return 2;
        case SolveStatus::InvalidMaze:
            BREACH_LOGE("CLI", "labirinto invalido: %s", to_string(r.defect));
            return 1;
    }
    return 1;
}
