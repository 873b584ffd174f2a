#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file Method.hpp
 * @brief Métodos de inicialização como valores (nome <-> método).
 */

namespace polymaze {

/**
 * @brief Instrução do programa do método spelunker.
 *
 * O valor é o caractere usado na forma textual.
 */
enum class Instruction : char {
    Forward = '|',   ///< Avança para a sala do outro lado da parede atual
    Left = '<',      ///< Gira para a parede anterior
    Right = '>',     ///< Gira para a próxima parede
    ForkLeft = '}',  ///< Guarda a parede anterior para uma ramificação posterior
    ForkRight = '{', ///< Guarda a próxima parede para uma ramificação posterior
};

using Instructions = std::vector<Instruction>;

/**
 * @brief Converte um programa textual.
 * @return std::nullopt para caracteres desconhecidos ou programa sem nenhum avanço
 */
std::optional<Instructions> parse_instructions(const std::string& text);
std::string format_instructions(const Instructions& instructions);

/**
 * @brief Método de inicialização, com o programa quando for spelunker.
 */
struct Method {
    enum class Kind : uint8_t {
        Braid,     ///< Sem becos sem saída, com laços
        Branching, ///< Prim aleatorizado (padrão)
        Clear,     ///< Abre tudo
        Dividing,  ///< Divisão recursiva
        Spelunker, ///< Caminhante programável
        Winding,   ///< Busca em profundidade
    };

    Kind kind{Kind::Branching};
    Instructions instructions; ///< Usado apenas por Kind::Spelunker
};

bool operator==(const Method& a, const Method& b);
inline bool operator!=(const Method& a, const Method& b) { return !(a == b); }

/**
 * @brief Aceita "braid", "branching", "clear", "dividing", "winding" e
 *        "spelunker(<programa>)".
 */
std::optional<Method> parse_method(const std::string& text);

/// Inverso de parse_method().
std::string method_name(const Method& method);

} // namespace polymaze
