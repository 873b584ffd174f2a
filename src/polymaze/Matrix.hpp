#pragma once
#include <cstddef>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "Geometry.hpp"

/**
 * @file Matrix.hpp
 * @brief Matriz 2D genérica armazenada em ordem de linhas.
 */

namespace polymaze {

/**
 * @brief Percorre as posições de uma grade em ordem de linhas.
 *
 * Pode ser iterada quantas vezes for necessário.
 */
class PositionRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Pos;
        using difference_type = std::ptrdiff_t;
        using pointer = const Pos*;
        using reference = Pos;

        iterator(Pos pos, int width) : pos_(pos), width_(width) {}
        Pos operator*() const { return pos_; }
        iterator& operator++() {
            if (++pos_.col >= width_) {
                pos_.col = 0;
                ++pos_.row;
            }
            return *this;
        }
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }
        bool operator==(const iterator& o) const { return pos_ == o.pos_; }
        bool operator!=(const iterator& o) const { return !(pos_ == o.pos_); }

    private:
        Pos pos_;
        int width_;
    };

    PositionRange(int width, int height) : w_(width), h_(height) {}
    iterator begin() const { return w_ > 0 && h_ > 0 ? iterator({0, 0}, w_) : end(); }
    iterator end() const { return iterator({0, h_ > 0 && w_ > 0 ? h_ : 0}, w_); }
    std::size_t size() const {
        return w_ > 0 && h_ > 0 ? static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_) : 0;
    }

private:
    int w_;
    int h_;
};

/**
 * @brief Matriz densa `width` × `height`.
 *
 * `operator[]` lança std::out_of_range fora da grade; `get` retorna nullptr.
 */
template <typename T>
class Matrix {
    // Evita a especialização std::vector<bool>
    struct Slot {
        T value;
    };

public:
    Matrix() = default;

    Matrix(int width, int height, const T& value = T{})
        : w_(width > 0 ? width : 0), h_(height > 0 ? height : 0),
          data_(static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_), Slot{value}) {}

    /**
     * @brief Cria a matriz preenchendo cada célula com `fn(pos)`.
     */
    template <typename F>
    static Matrix new_with_data(int width, int height, F fn) {
        Matrix result(width, height);
        for (Pos pos : result.positions()) result.data_[result.offset(pos)].value = fn(pos);
        return result;
    }

    int width() const { return w_; }
    int height() const { return h_; }

    bool is_inside(Pos pos) const {
        return pos.col >= 0 && pos.row >= 0 && pos.col < w_ && pos.row < h_;
    }

    T& operator[](Pos pos) { return data_[checked_offset(pos)].value; }
    const T& operator[](Pos pos) const { return data_[checked_offset(pos)].value; }

    /** @brief Acesso verificado: nullptr fora da grade. */
    T* get(Pos pos) { return is_inside(pos) ? &data_[offset(pos)].value : nullptr; }
    const T* get(Pos pos) const { return is_inside(pos) ? &data_[offset(pos)].value : nullptr; }

    PositionRange positions() const { return PositionRange(w_, h_); }

    /** @brief Cópia dos valores em ordem de linhas. */
    std::vector<T> values() const {
        std::vector<T> out;
        out.reserve(data_.size());
        for (const Slot& s : data_) out.push_back(s.value);
        return out;
    }

    template <typename F>
    auto map(F fn) const -> Matrix<std::decay_t<decltype(fn(std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(fn(std::declval<const T&>()))>;
        return Matrix<U>::new_with_data(w_, h_, [&](Pos pos) { return fn((*this)[pos]); });
    }

    template <typename F>
    auto map_with_pos(F fn) const
        -> Matrix<std::decay_t<decltype(fn(Pos{}, std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(fn(Pos{}, std::declval<const T&>()))>;
        return Matrix<U>::new_with_data(w_, h_, [&](Pos pos) { return fn(pos, (*this)[pos]); });
    }

    /**
     * @brief Preenche com `value` a região alcançável a partir de `pos`.
     *
     * Percorre em profundidade pelas posições retornadas por `neighbors(pos)`,
     * entrando apenas em células cujo valor difere de `value`.
     *
     * @return número de células alteradas (0 se `pos` estiver fora da grade)
     */
    template <typename N>
    std::size_t fill(Pos pos, const T& value, N neighbors) {
        if (!is_inside(pos)) return 0;
        std::size_t count = 1;
        (*this)[pos] = value;
        std::vector<Pos> path{pos};
        while (!path.empty()) {
            const Pos current = path.back();
            bool advanced = false;
            for (Pos next : neighbors(current)) {
                const T* v = get(next);
                if (v && !(*v == value)) {
                    (*this)[next] = value;
                    ++count;
                    path.push_back(next);
                    advanced = true;
                    break;
                }
            }
            if (!advanced) path.pop_back();
        }
        return count;
    }

    /**
     * @brief Fronteiras entre regiões de valores diferentes.
     *
     * A chave é o par (menor valor, maior valor); cada par de posições é
     * orientado da mesma forma.
     */
    template <typename N>
    std::map<std::pair<T, T>, std::set<std::pair<Pos, Pos>>> edges(N neighbors) const {
        std::map<std::pair<T, T>, std::set<std::pair<Pos, Pos>>> result;
        for (Pos p1 : positions()) {
            for (Pos p2 : neighbors(p1)) {
                if (!is_inside(p2)) continue;
                const T& k1 = (*this)[p1];
                const T& k2 = (*this)[p2];
                if (k1 < k2) {
                    result[{k1, k2}].insert({p1, p2});
                } else if (k2 < k1) {
                    result[{k2, k1}].insert({p2, p1});
                }
            }
        }
        return result;
    }

    /** @brief Soma elemento a elemento sobre a região comum. */
    Matrix operator+(const Matrix& other) const {
        const int w = w_ < other.w_ ? w_ : other.w_;
        const int h = h_ < other.h_ ? h_ : other.h_;
        return Matrix::new_with_data(w, h, [&](Pos pos) { return (*this)[pos] + other[pos]; });
    }

private:
    std::size_t offset(Pos pos) const {
        return static_cast<std::size_t>(pos.row) * static_cast<std::size_t>(w_)
             + static_cast<std::size_t>(pos.col);
    }

    std::size_t checked_offset(Pos pos) const {
        if (!is_inside(pos)) {
            throw std::out_of_range("polymaze::Matrix: (" + std::to_string(pos.col) + ", "
                                    + std::to_string(pos.row) + ") fora de "
                                    + std::to_string(w_) + "x" + std::to_string(h_));
        }
        return offset(pos);
    }

    int w_{0};
    int h_{0};
    std::vector<Slot> data_;
};

/**
 * @brief Matriz booleana a partir de um predicado sobre posições.
 * @return par (quantidade de posições aceitas, matriz)
 */
template <typename F>
std::pair<std::size_t, Matrix<bool>> filter(int width, int height, F pred) {
    Matrix<bool> result(width, height, false);
    std::size_t count = 0;
    for (Pos pos : result.positions()) {
        if (pred(pos)) {
            result[pos] = true;
            ++count;
        }
    }
    return {count, result};
}

} // namespace polymaze
