#pragma once
#include <cstdio>

/**
 * @file Log.hpp
 * @brief Log com tag via printf, filtrado em tempo de compilação.
 *
 * Formato: `TAG: mensagem`. Erros vão para stderr; demais níveis para stdout.
 * Ajuste o nível via CMake: `-DBREACH_LOG_LEVEL=4` (debug) ou `0` (silencioso).
 */

/**
 * @def BREACH_LOG_LEVEL
 * @brief 0=desligado, 1=erro, 2=aviso, 3=info, 4=debug.
 */
#ifndef BREACH_LOG_LEVEL
#define BREACH_LOG_LEVEL 2
#endif

#if BREACH_LOG_LEVEL >= 1
#define BREACH_LOGE(tag, fmt, ...) std::fprintf(stderr, tag ": " fmt "\n", ##__VA_ARGS__)
#else
#define BREACH_LOGE(tag, fmt, ...) ((void)0)
#endif

#if BREACH_LOG_LEVEL >= 2
#define BREACH_LOGW(tag, fmt, ...) std::printf(tag ": " fmt "\n", ##__VA_ARGS__)
#else
#define BREACH_LOGW(tag, fmt, ...) ((void)0)
#endif

#if BREACH_LOG_LEVEL >= 3
#define BREACH_LOGI(tag, fmt, ...) std::printf(tag ": " fmt "\n", ##__VA_ARGS__)
#else
#define BREACH_LOGI(tag, fmt, ...) ((void)0)
#endif

#if BREACH_LOG_LEVEL >= 4
#define BREACH_LOGD(tag, fmt, ...) std::printf(tag ": " fmt "\n", ##__VA_ARGS__)
#else
#define BREACH_LOGD(tag, fmt, ...) ((void)0)
#endif
