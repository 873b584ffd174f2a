#pragma once
#include <cstdio>
#include "Config.hpp"

/**
 * @file Log.hpp
 * @brief Macros de log com prefixo de módulo (`PMZ[TAG]: ...`).
 */

#if POLYMAZE_CFG_LOG
/// Mensagem informativa em stdout.
#  define POLYMAZE_LOG(tag, fmt, ...) \
    std::printf("PMZ[" tag "]: " fmt "\n", ##__VA_ARGS__)
/// Aviso/falha em stderr.
#  define POLYMAZE_WARN(tag, fmt, ...) \
    std::fprintf(stderr, "PMZ[" tag "]: " fmt "\n", ##__VA_ARGS__)
#else
#  define POLYMAZE_LOG(tag, fmt, ...) ((void)0)
#  define POLYMAZE_WARN(tag, fmt, ...) ((void)0)
#endif
