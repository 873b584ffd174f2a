#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

/**
 * @file Randomizer.hpp
 * @brief Fontes de números aleatórios usadas pelos algoritmos de geração.
 */

namespace polymaze {

/**
 * @brief Interface de aleatoriedade passada explicitamente aos algoritmos.
 */
class Randomizer {
public:
    virtual ~Randomizer() = default;

    /**
     * @brief Inteiro em [min(a, b), max(a, b)); retorna `a` quando a == b.
     */
    virtual std::size_t range(std::size_t a, std::size_t b) = 0;

    /** @brief Real em [0, 1). */
    virtual double random() = 0;
};

/**
 * @brief Randomizador com entropia do sistema (std::random_device + mt19937_64).
 */
class OsRandomizer : public Randomizer {
public:
    OsRandomizer();
    std::size_t range(std::size_t a, std::size_t b) override;
    double random() override;

private:
    std::mt19937_64 engine_;
};

/**
 * @brief Registrador de deslocamento com realimentação linear de 64 bits.
 *
 * Totalmente determinístico: duas instâncias com a mesma semente produzem a
 * mesma sequência. Cada chamada a advance() consome 64 bits.
 */
class Lfsr : public Randomizer {
public:
    explicit Lfsr(uint64_t seed) : state_(seed) {}

    /** @brief Avança 64 passos e retorna o novo estado. */
    uint64_t advance();

    std::size_t range(std::size_t a, std::size_t b) override;
    double random() override;

    uint64_t state() const { return state_; }
    bool operator==(const Lfsr& other) const { return state_ == other.state_; }
    bool operator!=(const Lfsr& other) const { return state_ != other.state_; }

private:
    uint64_t state_;
};

/**
 * @brief Lê uma semente de LFSR em decimal.
 * @return std::nullopt para texto vazio, sinal, lixo no final, estouro ou
 *         zero (o estado zero nunca sai do zero)
 */
std::optional<uint64_t> parse_seed(const char* text);

} // namespace polymaze
