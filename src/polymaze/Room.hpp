#pragma once
#include <bitset>
#include <utility>
#include "Wall.hpp"

/**
 * @file Room.hpp
 * @brief Estado de uma sala: paredes abertas, marca de visita e dado do usuário.
 */

namespace polymaze {

/**
 * @brief Sala do labirinto.
 *
 * `visited` passa a true assim que qualquer parede é aberta e não volta a
 * false, exceto por restore().
 */
template <typename T>
class Room {
public:
    bool visited{false}; ///< Alcançada por algum algoritmo de geração
    T data{};            ///< Dado associado à sala

    Room() = default;
    explicit Room(T value) : data(std::move(value)) {}

    bool is_open(const Wall& wall) const { return (walls_ & wall.mask()) != 0; }

    void set_open(const Wall& wall, bool value) {
        if (value) {
            walls_ |= wall.mask();
            visited = true;
        } else {
            walls_ &= ~wall.mask();
        }
    }

    void open(const Wall& wall) { set_open(wall, true); }
    void close(const Wall& wall) { set_open(wall, false); }

    /// Quantidade de paredes abertas.
    unsigned open_walls() const {
        return static_cast<unsigned>(std::bitset<32>(walls_).count());
    }

    /// Máscara bruta das paredes abertas.
    Mask mask() const { return walls_; }

    /// Recoloca o estado salvo (usado por snapshots).
    void restore(Mask mask, bool was_visited) {
        walls_ = mask;
        visited = was_visited;
    }

private:
    Mask walls_{0};
};

} // namespace polymaze
