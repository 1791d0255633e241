#pragma once

/**
 * @file Config.hpp
 * @brief Parâmetros de configuração em tempo de compilação (BREACH_CFG_*).
 *
 * Podem ser sobrepostos via opções `-D` no CMake, ex.:
 * `-DBREACH_CFG_PARALLEL_MIN_TILES=1024`.
 */

/**
 * @def BREACH_CFG_PARALLEL_MIN_TILES
 * @brief Tamanho mínimo da grade (tiles) para que a opção paralela crie tarefas.
 *
 * Abaixo disso o solver roda sequencialmente mesmo com `parallel=true`.
 */
#ifndef BREACH_CFG_PARALLEL_MIN_TILES
#define BREACH_CFG_PARALLEL_MIN_TILES 4096
#endif

/**
 * @def BREACH_CFG_MAX_WORKERS
 * @brief Limite de threads da varredura paralela de paredes.
 */
#ifndef BREACH_CFG_MAX_WORKERS
#define BREACH_CFG_MAX_WORKERS 8
#endif

/**
 * @def BREACH_CFG_SIM_CELL_PX
 * @brief Tamanho de cada tile no simulador (pixels).
 */
#ifndef BREACH_CFG_SIM_CELL_PX
#define BREACH_CFG_SIM_CELL_PX 24
#endif
