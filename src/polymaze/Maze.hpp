#pragma once
#include <optional>
#include <utility>
#include <vector>
#include "Matrix.hpp"
#include "Room.hpp"
#include "Shape.hpp"

/**
 * @file Maze.hpp
 * @brief Labirinto genérico: formato + matriz de salas com paredes simétricas.
 */

namespace polymaze {

/**
 * @brief Labirinto de `width` × `height` salas de um formato fixo.
 *
 * Invariante: `is_open(w) == is_open(back(w))` para toda parede, mantido
 * por set_open(), que escreve os dois lados. Cópias são profundas.
 *
 * @tparam T dado associado a cada sala (precisa ter construtor padrão)
 */
template <typename T = int>
class Maze {
public:
    /**
     * @brief Cria o labirinto com todas as paredes fechadas e nenhuma sala visitada.
     */
    Maze(Shape shape, int width, int height)
        : shape_(shape), rooms_(width, height) {}

    /**
     * @brief Cria o labirinto inicializando o dado de cada sala com `fn(pos)`.
     */
    template <typename F>
    static Maze with_data(Shape shape, int width, int height, F fn) {
        Maze maze(shape, width, height);
        for (Pos pos : maze.positions()) maze.rooms_[pos].data = fn(pos);
        return maze;
    }

    Shape shape() const { return shape_; }
    int width() const { return rooms_.width(); }
    int height() const { return rooms_.height(); }
    bool is_inside(Pos pos) const { return rooms_.is_inside(pos); }
    PositionRange positions() const { return rooms_.positions(); }

    /** @brief Sala em `pos`; lança std::out_of_range fora da grade. */
    Room<T>& operator[](Pos pos) { return rooms_[pos]; }
    const Room<T>& operator[](Pos pos) const { return rooms_[pos]; }

    /** @brief Matriz de salas (somente leitura). */
    const Matrix<Room<T>>& rooms() const { return rooms_; }

    /** @brief Dado da sala, ou nullptr fora da grade. */
    T* data(Pos pos) {
        Room<T>* room = rooms_.get(pos);
        return room ? &room->data : nullptr;
    }
    const T* data(Pos pos) const {
        const Room<T>* room = rooms_.get(pos);
        return room ? &room->data : nullptr;
    }

    // Geometria (delegada ao formato)

    const std::vector<const Wall*>& all_walls() const { return polymaze::all_walls(shape_); }
    const std::vector<const Wall*>& walls(Pos pos) const { return polymaze::walls(shape_, pos); }
    WallPos back(const WallPos& wall_pos) const { return polymaze::back(shape_, wall_pos); }
    const Wall* opposite(const WallPos& wall_pos) const { return polymaze::opposite(shape_, wall_pos); }
    PhysicalPos center(Pos pos) const { return polymaze::center(shape_, pos); }
    Pos room_at(PhysicalPos pos) const { return polymaze::room_at(shape_, pos); }
    WallPos wall_pos_at(PhysicalPos pos) const { return polymaze::wall_pos_at(shape_, pos); }
    ViewBox viewbox() const { return polymaze::viewbox(shape_, width(), height()); }
    std::vector<WallPos> corner_walls(const WallPos& wall_pos) const {
        return polymaze::corner_walls(shape_, wall_pos);
    }

    /**
     * @brief Cantos físicos (início, fim) do intervalo da parede.
     */
    std::pair<PhysicalPos, PhysicalPos> corners(const WallPos& wall_pos) const {
        const PhysicalPos c = center(wall_pos.pos);
        return {c + wall_pos.wall->span.start, c + wall_pos.wall->span.end};
    }

    // Estado das paredes

    /** @brief false quando a sala está fora da grade. */
    bool is_open(const WallPos& wall_pos) const {
        const Room<T>* room = rooms_.get(wall_pos.pos);
        return room && room->is_open(*wall_pos.wall);
    }

    /**
     * @brief Abre ou fecha a parede dos dois lados (quando cada lado está na grade).
     */
    void set_open(const WallPos& wall_pos, bool value) {
        if (Room<T>* room = rooms_.get(wall_pos.pos)) room->set_open(*wall_pos.wall, value);
        const WallPos other = back(wall_pos);
        if (Room<T>* room = rooms_.get(other.pos)) room->set_open(*other.wall, value);
    }

    void open(const WallPos& wall_pos) { set_open(wall_pos, true); }
    void close(const WallPos& wall_pos) { set_open(wall_pos, false); }

    // Consultas

    /** @brief Parede de `from` que leva a `to`, se forem vizinhas. */
    std::optional<WallPos> connecting_wall(Pos from, Pos to) const {
        for (const Wall* wall : walls(from)) {
            if (from + wall->dir == to) return WallPos{from, wall};
        }
        return std::nullopt;
    }

    /** @brief true se as salas são a mesma ou se a parede entre elas está aberta. */
    bool connected(Pos a, Pos b) const {
        if (a == b) return true;
        const auto wall_pos = connecting_wall(a, b);
        return wall_pos && is_open(*wall_pos);
    }

    /** @brief Todas as paredes da sala. */
    std::vector<WallPos> wall_positions(Pos pos) const {
        std::vector<WallPos> result;
        for (const Wall* wall : walls(pos)) result.push_back(WallPos{pos, wall});
        return result;
    }

    /** @brief Paredes abertas da sala. */
    std::vector<WallPos> doors(Pos pos) const {
        std::vector<WallPos> result;
        for (const Wall* wall : walls(pos)) {
            const WallPos wp{pos, wall};
            if (is_open(wp)) result.push_back(wp);
        }
        return result;
    }

    /** @brief Salas na grade alcançáveis por uma parede aberta. */
    std::vector<Pos> neighbors(Pos pos) const {
        std::vector<Pos> result;
        for (const Wall* wall : walls(pos)) {
            const Pos next = pos + wall->dir;
            if (is_inside(next) && is_open(WallPos{pos, wall})) result.push_back(next);
        }
        return result;
    }

    /** @brief Salas vizinhas, abertas ou não, inclusive fora da grade. */
    std::vector<Pos> adjacent(Pos pos) const {
        std::vector<Pos> result;
        for (const Wall* wall : walls(pos)) result.push_back(pos + wall->dir);
        return result;
    }

    /**
     * @brief Salas cujo centro ou algum canto cai dentro de `box`.
     *
     * Busca em anéis ao redor da sala sob o centro da caixa e para quando um
     * anel não acrescenta nada; pode deixar de fora salas apenas tocadas por
     * uma aresta. Posições fora da grade também podem ser retornadas.
     */
    std::vector<Pos> rooms_touched_by(const ViewBox& box) const {
        const Pos start = room_at(box.center());
        std::vector<Pos> result;
        for (int distance = 0;; ++distance) {
            const std::size_t before = result.size();
            for (Pos pos : surround(start, distance)) {
                if (touches(pos, box)) result.push_back(pos);
            }
            if (result.size() == before) break;
        }
        return result;
    }

private:
    bool touches(Pos pos, const ViewBox& box) const {
        const PhysicalPos c = center(pos);
        if (box.contains(c)) return true;
        for (const Wall* wall : walls(pos)) {
            if (box.contains(c + wall->span.start)) return true;
        }
        return false;
    }

    Shape shape_;
    Matrix<Room<T>> rooms_;
};

} // namespace polymaze
