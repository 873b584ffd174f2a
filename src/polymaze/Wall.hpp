#pragma once
#include <cstddef>
#include <cstdint>
#include "Geometry.hpp"

/**
 * @file Wall.hpp
 * @brief Descritores estáticos de paredes e o par (sala, parede).
 */

namespace polymaze {

enum class Shape : uint8_t;

/// Máscara de bits das paredes abertas de uma sala.
using Mask = uint32_t;
/// Índice de uma parede dentro do catálogo do seu formato.
using WallIndex = std::size_t;

/**
 * @brief Deslocamento até uma parede que compartilha o canto inicial de outra.
 */
struct Offset {
    int dx{0};        ///< Deslocamento de coluna
    int dy{0};        ///< Deslocamento de linha
    WallIndex wall{0};///< Índice da parede na sala deslocada
};

/**
 * @brief Intervalo angular [start, end) ocupado por uma parede.
 */
struct Span {
    Angle start; ///< Ângulo (e canto) inicial
    Angle end;   ///< Ângulo (e canto) final
};

/**
 * @brief Parede de um formato de sala; nunca é modificada em tempo de execução.
 *
 * Igualdade considera apenas (formato, índice, direção).
 */
struct Wall {
    const char* name;                    ///< Nome legível (ex.: "UP_LEFT0")
    Shape shape;                         ///< Formato ao qual pertence
    std::size_t ordinal;                 ///< Posição na lista de paredes da sala
    WallIndex index;                     ///< Índice único no formato
    const Offset* corner_wall_offsets;   ///< Paredes que compartilham o canto inicial
    std::size_t corner_wall_count;       ///< Quantidade de entradas em corner_wall_offsets
    Pos dir;                             ///< Deslocamento até a sala do outro lado
    Span span;                           ///< Intervalo angular
    const Wall* previous;                ///< Parede anterior (sentido angular) na mesma sala
    const Wall* next;                    ///< Próxima parede na mesma sala

    /** @brief Bit desta parede na máscara da sala. */
    Mask mask() const { return Mask{1} << index; }

    /**
     * @brief Indica se o ângulo (normalizado para [0, 2π)) pertence ao intervalo da parede.
     *
     * Intervalos que cruzam 2π (start > end) são tratados com wraparound.
     */
    bool in_span(float angle) const;

    /** @brief Largura angular do intervalo, sempre positiva. */
    float span_width() const;

    /** @brief Primeira entrada de corner_wall_offsets (para iteração). */
    const Offset* corners_begin() const { return corner_wall_offsets; }
    /** @brief Fim de corner_wall_offsets. */
    const Offset* corners_end() const { return corner_wall_offsets + corner_wall_count; }
};

bool operator==(const Wall& a, const Wall& b);
inline bool operator!=(const Wall& a, const Wall& b) { return !(a == b); }
/// Ordenação pelo índice.
inline bool operator<(const Wall& a, const Wall& b) { return a.index < b.index; }

/**
 * @brief Uma parede vista de uma sala específica.
 */
struct WallPos {
    Pos pos{};                 ///< Sala
    const Wall* wall{nullptr}; ///< Parede da sala
};

bool operator==(const WallPos& a, const WallPos& b);
inline bool operator!=(const WallPos& a, const WallPos& b) { return !(a == b); }
/// Ordena por sala e, em seguida, pelo índice da parede.
bool operator<(const WallPos& a, const WallPos& b);

} // namespace polymaze
