#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "Log.hpp"
#include "Maze.hpp"

/**
 * @file Snapshot.hpp
 * @brief Snapshot em memória do estado das paredes de um labirinto.
 *
 * Formato (little-endian):
 * - cabeçalho de 16 bytes: magic 'PMZS', versão, formato (número de
 *   paredes), reservado, largura, altura, tamanho do payload;
 * - payload: um registro de 16 bits por sala em ordem de linhas, com a
 *   máscara de paredes abertas nos bits 0..14 e a marca de visita no bit 15.
 *
 * Os dados do usuário (`Room::data`) não fazem parte do snapshot. Nada é
 * gravado em arquivo.
 */

namespace polymaze {

/** @brief Magic do snapshot ('P','M','Z','S'). */
constexpr uint32_t SNAPSHOT_MAGIC = 0x504D5A53u;
/** @brief Versão do layout. */
constexpr uint16_t SNAPSHOT_VERSION = 0x0001u;
/** @brief Tamanho do cabeçalho em bytes. */
constexpr std::size_t SNAPSHOT_HEADER_SIZE = 16;
/** @brief Bit de "visitada" em cada registro. */
constexpr uint16_t SNAPSHOT_VISITED_BIT = 0x8000u;

/**
 * @brief Conteúdo validado de um snapshot.
 */
struct SnapshotData {
    Shape shape{Shape::Quad};
    int width{0};
    int height{0};
    std::vector<uint16_t> records; ///< Um por sala, em ordem de linhas
};

/**
 * @brief Serializa registros já montados.
 * @return vetor vazio se as dimensões excederem os limites do formato
 */
std::vector<uint8_t> encode_snapshot_records(Shape shape, int width, int height,
                                             const std::vector<uint16_t>& records);

/**
 * @brief Valida cabeçalho, tamanho e registros (paredes existentes e simétricas).
 * @return std::nullopt em qualquer inconsistência (com aviso no log)
 */
std::optional<SnapshotData> parse_snapshot(const std::vector<uint8_t>& bytes);

/**
 * @brief Serializa o estado das paredes de `maze`.
 */
template <typename T>
std::vector<uint8_t> encode_snapshot(const Maze<T>& maze) {
    std::vector<uint16_t> records;
    records.reserve(static_cast<std::size_t>(maze.width()) * static_cast<std::size_t>(maze.height()));
    for (Pos pos : maze.positions()) {
        const Room<T>& room = maze[pos];
        uint16_t r = static_cast<uint16_t>(room.mask() & 0x7FFFu);
        if (room.visited) r |= SNAPSHOT_VISITED_BIT;
        records.push_back(r);
    }
    return encode_snapshot_records(maze.shape(), maze.width(), maze.height(), records);
}

/**
 * @brief Cria um labirinto novo a partir de um snapshot.
 */
template <typename T>
std::optional<Maze<T>> decode_snapshot(const std::vector<uint8_t>& bytes) {
    const auto data = parse_snapshot(bytes);
    if (!data) return std::nullopt;
    Maze<T> maze(data->shape, data->width, data->height);
    std::size_t i = 0;
    for (Pos pos : maze.positions()) {
        const uint16_t r = data->records[i++];
        maze[pos].restore(r & 0x7FFFu, (r & SNAPSHOT_VISITED_BIT) != 0);
    }
    return maze;
}

/**
 * @brief Recoloca um snapshot em um labirinto existente.
 *
 * Formato e dimensões precisam coincidir; os dados das salas são preservados.
 * @return false (labirinto intocado) em caso de divergência ou snapshot inválido
 */
template <typename T>
bool restore_snapshot(Maze<T>& maze, const std::vector<uint8_t>& bytes) {
    const auto data = parse_snapshot(bytes);
    if (!data) return false;
    if (data->shape != maze.shape() || data->width != maze.width() || data->height != maze.height()) {
        POLYMAZE_WARN("SNAP", "restore: snapshot %s %dx%d does not match maze %s %dx%d",
                      shape_name(data->shape), data->width, data->height,
                      shape_name(maze.shape()), maze.width(), maze.height());
        return false;
    }
    std::size_t i = 0;
    for (Pos pos : maze.positions()) {
        const uint16_t r = data->records[i++];
        maze[pos].restore(r & 0x7FFFu, (r & SNAPSHOT_VISITED_BIT) != 0);
    }
    POLYMAZE_LOG("SNAP", "restore ok (%dx%d)", maze.width(), maze.height());
    return true;
}

} // namespace polymaze
