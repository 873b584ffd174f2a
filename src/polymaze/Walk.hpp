#pragma once
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <queue>
#include <utility>
#include <vector>
#include "Maze.hpp"

/**
 * @file Walk.hpp
 * @brief Caminho mais curto entre duas salas (A*) sobre as paredes abertas.
 */

namespace polymaze {

/**
 * @brief Caminho de `from` até `to`, inclusive.
 *
 * Guarda apenas o mapa "veio de" produzido pela busca; as posições são
 * geradas sob demanda e o caminho pode ser percorrido várias vezes.
 */
class Path {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Pos;
        using difference_type = std::ptrdiff_t;
        using pointer = const Pos*;
        using reference = Pos;

        iterator() = default;
        iterator(const Path* path, Pos pos) : path_(path), pos_(pos) {}

        Pos operator*() const { return pos_; }
        iterator& operator++() {
            if (pos_ == path_->to_) {
                path_ = nullptr;
            } else {
                pos_ = *path_->came_from_[pos_];
            }
            return *this;
        }
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }
        bool operator==(const iterator& o) const {
            return path_ == o.path_ && (path_ == nullptr || pos_ == o.pos_);
        }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        const Path* path_{nullptr}; ///< nullptr = fim
        Pos pos_{};
    };

    Path(Pos from, Pos to, Matrix<std::optional<Pos>> came_from)
        : from_(from), to_(to), came_from_(std::move(came_from)) {}

    Pos from() const { return from_; }
    Pos to() const { return to_; }

    iterator begin() const { return iterator(this, from_); }
    iterator end() const { return iterator(); }

    /** @brief Materializa as posições do caminho. */
    std::vector<Pos> to_vector() const { return std::vector<Pos>(begin(), end()); }

private:
    Pos from_;
    Pos to_;
    Matrix<std::optional<Pos>> came_from_; ///< Próxima sala em direção a `to`
};

namespace detail {

/// Estado de uma sala durante a busca.
struct WalkNode {
    uint32_t f{std::numeric_limits<uint32_t>::max()};
    uint32_t g{std::numeric_limits<uint32_t>::max()};
    bool visited{false};
    std::optional<Pos> came_from;
};

/**
 * @brief Fila de prioridade (menor f primeiro) que sabe se uma sala está pendente.
 */
class OpenSet {
public:
    OpenSet(int width, int height) : present_(width, height, false) {}

    void push(uint32_t priority, Pos pos) {
        if (!present_.is_inside(pos)) return;
        heap_.push({priority, pos});
        present_[pos] = true;
    }

    std::optional<Pos> pop() {
        if (heap_.empty()) return std::nullopt;
        const Pos pos = heap_.top().second;
        heap_.pop();
        present_[pos] = false;
        return pos;
    }

    bool contains(Pos pos) const {
        const bool* p = present_.get(pos);
        return p && *p;
    }

private:
    using Entry = std::pair<uint32_t, Pos>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap_;
    Matrix<bool> present_;
};

} // namespace detail

/**
 * @brief Busca o caminho mais curto de `from` até `to` por paredes abertas.
 *
 * A busca parte de `to` em direção a `from`, de modo que o mapa resultante
 * já aponta de `from` para `to`. Heurística: distância de Manhattan.
 *
 * @return caminho, ou std::nullopt se alguma sala estiver fora da grade ou
 *         não houver ligação entre elas
 */
template <typename T>
std::optional<Path> walk(const Maze<T>& maze, Pos from, Pos to) {
    if (!maze.is_inside(from) || !maze.is_inside(to)) return std::nullopt;

    const Pos start = to;
    const Pos end = from;
    auto h = [end](Pos pos) -> uint32_t {
        return static_cast<uint32_t>(std::abs(pos.col - end.col) + std::abs(pos.row - end.row));
    };

    detail::OpenSet open_set(maze.width(), maze.height());
    open_set.push(0, start);

    Matrix<detail::WalkNode> rooms(maze.width(), maze.height());
    rooms[start].g = 0;
    rooms[start].f = h(start);

    while (const auto popped = open_set.pop()) {
        const Pos current = *popped;
        if (current == end) {
            return Path(from, to, rooms.map([](const detail::WalkNode& n) { return n.came_from; }));
        }

        rooms[current].visited = true;
        for (const WallPos& door : maze.doors(current)) {
            const Pos next = maze.back(door).pos;
            if (!maze.is_inside(next)
                || (rooms[next].visited && rooms[next].g <= rooms[current].g + 1)) {
                continue;
            }

            const uint32_t g = rooms[current].g + 1;
            const uint32_t f = g + h(next);

            // Só atualiza quando a sala atual não está pendente ou melhorou
            const bool current_in_open_set = open_set.contains(current);
            if (!current_in_open_set || g < rooms[current].g) {
                rooms[next].g = g;
                rooms[next].f = f;
                rooms[next].came_from = current;
                if (!current_in_open_set) open_set.push(f, next);
            }
        }
    }

    return std::nullopt;
}

} // namespace polymaze
