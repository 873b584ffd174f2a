#pragma once
#include <cmath>
#include <utility>
#include <algorithm>
#include <limits>

/**
 * @file Geometry.hpp
 * @brief Coordenadas de grade, coordenadas físicas, ângulos e caixas de visualização.
 */

namespace polymaze {

/// 2π em precisão simples.
constexpr float RADIAN_BOUND = 6.28318530717958647692f;
/// π em precisão simples.
constexpr float PI = 3.14159265358979323846f;

constexpr float COS_30 = 0.866025404f;
constexpr float SIN_30 = 0.5f;
constexpr float COS_45 = 0.707106781f;
constexpr float SIN_45 = 0.707106781f;

/**
 * @brief Posição (coluna, linha) de uma sala na grade.
 *
 * Não é validada por si só; a validade depende das dimensões da matriz.
 */
struct Pos {
    int col{0}; ///< Coluna
    int row{0}; ///< Linha
};

inline bool operator==(Pos a, Pos b) { return a.col == b.col && a.row == b.row; }
inline bool operator!=(Pos a, Pos b) { return !(a == b); }
/// Ordem lexicográfica (col, row).
inline bool operator<(Pos a, Pos b) {
    return a.col < b.col || (a.col == b.col && a.row < b.row);
}
inline Pos operator+(Pos a, Pos b) { return Pos{a.col + b.col, a.row + b.row}; }

/**
 * @brief Ângulo com cosseno/seno pré-calculados.
 */
struct Angle {
    float a{0.0f};  ///< Ângulo em radianos
    float dx{1.0f}; ///< cos(a)
    float dy{0.0f}; ///< sin(a)
};

/**
 * @brief Normaliza um ângulo para o intervalo [0, 2π).
 */
inline float normalized_angle(float angle) {
    if (angle >= 0.0f && angle < RADIAN_BOUND) return angle;
    float t = std::fmod(angle, RADIAN_BOUND);
    if (t < 0.0f) t += RADIAN_BOUND;
    // fmod de valores negativos muito pequenos pode arredondar para 2π
    return t >= RADIAN_BOUND ? 0.0f : t;
}

/**
 * @brief Posição no plano físico (unidades de aresta).
 */
struct PhysicalPos {
    float x{0.0f}; ///< Coordenada horizontal
    float y{0.0f}; ///< Coordenada vertical (cresce para baixo)

    /** @brief Comprimento ao quadrado do vetor (x, y). */
    float value() const { return x * x + y * y; }
};

inline bool operator==(PhysicalPos a, PhysicalPos b) { return a.x == b.x && a.y == b.y; }
inline PhysicalPos operator+(PhysicalPos a, PhysicalPos b) { return {a.x + b.x, a.y + b.y}; }
inline PhysicalPos operator-(PhysicalPos a, PhysicalPos b) { return {a.x - b.x, a.y - b.y}; }
inline PhysicalPos operator*(PhysicalPos a, float k) { return {a.x * k, a.y * k}; }
/// Desloca a posição pelo vetor unitário do ângulo.
inline PhysicalPos operator+(PhysicalPos a, const Angle& angle) {
    return {a.x + angle.dx, a.y + angle.dy};
}

/**
 * @brief Retângulo alinhado aos eixos (canto superior esquerdo + dimensões).
 */
struct ViewBox {
    PhysicalPos corner{}; ///< Canto superior esquerdo
    float width{0.0f};    ///< Largura
    float height{0.0f};   ///< Altura

    /** @brief Caixa de dimensões dadas centrada em `pos`. */
    static ViewBox centered_at(PhysicalPos pos, float width, float height) {
        return ViewBox{{pos.x - 0.5f * width, pos.y - 0.5f * height}, width, height};
    }

    /**
     * @brief Menor caixa que contém todos os pontos do intervalo [first, last).
     * @return caixa vazia na origem se o intervalo estiver vazio
     */
    template <typename It>
    static ViewBox enclosing(It first, It last) {
        if (first == last) return ViewBox{};
        float l = std::numeric_limits<float>::max();
        float t = std::numeric_limits<float>::max();
        float r = std::numeric_limits<float>::lowest();
        float b = std::numeric_limits<float>::lowest();
        for (; first != last; ++first) {
            const PhysicalPos& p = *first;
            l = std::min(l, p.x); t = std::min(t, p.y);
            r = std::max(r, p.x); b = std::max(b, p.y);
        }
        return ViewBox{{l, t}, r - l, b - t};
    }

    /** @brief Expande (ou contrai, se negativo) `d` unidades em todas as direções. */
    ViewBox expand(float d) const {
        return ViewBox{{corner.x - d, corner.y - d}, width + 2.0f * d, height + 2.0f * d};
    }

    /** @brief Centro da caixa. */
    PhysicalPos center() const {
        return {corner.x + 0.5f * width, corner.y + 0.5f * height};
    }

    /** @brief Indica se `pos` está dentro da caixa (bordas inclusas). */
    bool contains(PhysicalPos pos) const {
        return pos.x >= corner.x && pos.y >= corner.y
            && pos.x <= corner.x + width && pos.y <= corner.y + height;
    }

    /**
     * @brief Divide a caixa por uma linha horizontal em `y = at`.
     * @return par (parte de cima, parte de baixo)
     */
    std::pair<ViewBox, ViewBox> split_horizontal(float at) const {
        return {ViewBox{corner, width, at - corner.y},
                ViewBox{{corner.x, at}, width, corner.y + height - at}};
    }

    /**
     * @brief Divide a caixa por uma linha vertical em `x = at`.
     * @return par (parte da esquerda, parte da direita)
     */
    std::pair<ViewBox, ViewBox> split_vertical(float at) const {
        return {ViewBox{corner, at - corner.x, height},
                ViewBox{{at, corner.y}, corner.x + width - at, height}};
    }

    /** @brief Escala todas as coordenadas por `k`. */
    ViewBox operator*(float k) const {
        return ViewBox{{corner.x * k, corner.y * k}, width * k, height * k};
    }
};

inline bool operator==(const ViewBox& a, const ViewBox& b) {
    return a.corner == b.corner && a.width == b.width && a.height == b.height;
}

/**
 * @brief Separa `x` em parte inteira (piso) e parte fracionária em [0, 1).
 */
inline std::pair<int, float> partition(float x) {
    const float f = std::floor(x);
    return {static_cast<int>(f), x - f};
}

} // namespace polymaze
