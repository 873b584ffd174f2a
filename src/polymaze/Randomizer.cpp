/**
 * @file Randomizer.cpp
 */
#include "Randomizer.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace polymaze {

OsRandomizer::OsRandomizer() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

std::size_t OsRandomizer::range(std::size_t a, std::size_t b) {
    if (a == b) return a;
    if (b < a) std::swap(a, b);
    std::uniform_int_distribution<std::size_t> dist(a, b - 1);
    return dist(engine_);
}

double OsRandomizer::random() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

uint64_t Lfsr::advance() {
    for (int i = 0; i < 64; ++i) {
        const uint64_t bit = (state_ ^ (state_ >> 2) ^ (state_ >> 3) ^ (state_ >> 5)) & 1u;
        state_ = (state_ >> 1) | (bit << 63);
    }
    return state_;
}

std::size_t Lfsr::range(std::size_t a, std::size_t b) {
    // O estado avança mesmo em intervalo vazio
    const uint64_t value = advance();
    const std::size_t low = a < b ? a : b;
    const std::size_t high = a < b ? b : a;
    if (low == high) return low;
    return low + static_cast<std::size_t>(value % static_cast<uint64_t>(high - low));
}

double Lfsr::random() {
    const double value = static_cast<double>(advance())
                       / static_cast<double>(std::numeric_limits<uint64_t>::max());
    // UINT64_MAX / UINT64_MAX daria exatamente 1.0
    return value < 1.0 ? value : std::nextafter(1.0, 0.0);
}

std::optional<uint64_t> parse_seed(const char* text) {
    // strtoull aceitaria espaços e '-' e devolveria o valor negado
    if (!text || *text < '0' || *text > '9') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (*end != '\0' || errno == ERANGE || value == 0) return std::nullopt;
    return static_cast<uint64_t>(value);
}

} // namespace polymaze
