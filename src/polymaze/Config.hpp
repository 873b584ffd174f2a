#pragma once

/**
 * @file Config.hpp
 * @brief Parâmetros de configuração em tempo de compilação.
 *
 * Cada valor pode ser sobrescrito pelo CMake (ex.: `-DPOLYMAZE_CFG_LOG=0`).
 */

/// Habilita (1) ou desabilita (0) as mensagens de log da biblioteca.
#ifndef POLYMAZE_CFG_LOG
#define POLYMAZE_CFG_LOG 1
#endif

/// Formato padrão do labirinto, em número de paredes (3, 4 ou 6).
#ifndef POLYMAZE_CFG_DEFAULT_SHAPE
#define POLYMAZE_CFG_DEFAULT_SHAPE 4
#endif

/// Largura padrão (colunas) usada pelo visualizador.
#ifndef POLYMAZE_CFG_DEFAULT_WIDTH
#define POLYMAZE_CFG_DEFAULT_WIDTH 20
#endif

/// Altura padrão (linhas) usada pelo visualizador.
#ifndef POLYMAZE_CFG_DEFAULT_HEIGHT
#define POLYMAZE_CFG_DEFAULT_HEIGHT 14
#endif

/// Semente padrão do LFSR quando nenhuma é informada.
#ifndef POLYMAZE_CFG_DEFAULT_SEED
#define POLYMAZE_CFG_DEFAULT_SEED 12345u
#endif

/// Programa padrão do método spelunker.
#ifndef POLYMAZE_CFG_SPELUNKER_PROGRAM
#define POLYMAZE_CFG_SPELUNKER_PROGRAM "||}|>||{|<"
#endif

/// Limite de salas aceito por um snapshot (cabeçalho usa 16 bits por dimensão).
#ifndef POLYMAZE_CFG_SNAPSHOT_MAX_ROOMS
#define POLYMAZE_CFG_SNAPSHOT_MAX_ROOMS (1024u * 1024u)
#endif
