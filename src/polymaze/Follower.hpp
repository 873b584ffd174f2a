#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "Maze.hpp"

/**
 * @file Follower.hpp
 * @brief Seguidor de paredes e extração de contornos.
 */

namespace polymaze {

/// Par (parede atual, próxima parede); a próxima é vazia no último item.
using FollowWallItem = std::pair<WallPos, std::optional<WallPos>>;

/**
 * @brief Percorre as paredes fechadas que contornam uma região sem atravessar
 *        paredes abertas, até reencontrar a parede inicial.
 *
 * Cada parede é percorrida do canto inicial para o final do seu intervalo.
 * Se a parede inicial estiver aberta não há nenhum item.
 */
template <typename T>
class Follower {
public:
    Follower(const Maze<T>& maze, WallPos start)
        : maze_(maze), start_(start), current_(start), finished_(maze.is_open(start)) {}

    /** @brief Próximo item, ou std::nullopt quando o contorno terminou. */
    std::optional<FollowWallItem> next() {
        if (finished_) return std::nullopt;
        const WallPos previous = current_;
        current_ = next_wall_pos(current_);
        finished_ = current_ == start_;
        return FollowWallItem{previous, finished_ ? std::nullopt : std::optional<WallPos>(current_)};
    }

private:
    WallPos next_wall_pos(const WallPos& wall_pos) const {
        // Paredes ao redor do canto final, na ordem em que são alcançadas
        const WallPos back = maze_.back(wall_pos);
        const auto candidates = maze_.corner_walls(back);
        for (std::size_t i = 1; i < candidates.size(); ++i) {
            if (!maze_.is_open(candidates[i])) return candidates[i];
        }
        return back;
    }

    const Maze<T>& maze_;
    WallPos start_;
    WallPos current_;
    bool finished_;
};

/**
 * @brief Coleta todos os itens de um contorno a partir de `start`.
 */
template <typename T>
std::vector<FollowWallItem> follow_wall(const Maze<T>& maze, WallPos start) {
    std::vector<FollowWallItem> result;
    Follower<T> follower(maze, start);
    while (auto item = follower.next()) result.push_back(*item);
    return result;
}

/**
 * @brief Operação de desenho de um contorno.
 */
struct Operation {
    enum class Kind : uint8_t { Move, Line };
    Kind kind{Kind::Move};
    PhysicalPos pos{};
};

inline bool operator==(const Operation& a, const Operation& b) {
    return a.kind == b.kind && a.pos == b.pos;
}

/**
 * @brief Percorre as salas visitadas e gera, uma a uma, as polilinhas que
 *        cobrem cada parede fechada exatamente uma vez.
 */
template <typename T>
class Visitor {
public:
    explicit Visitor(const Maze<T>& maze)
        : maze_(maze), drawn_(maze.width(), maze.height(), 0),
          cursor_(maze.positions().begin()), end_(maze.positions().end()) {}

    /**
     * @brief Próxima polilinha (Move seguido de Lines).
     * @return vazio quando não há mais paredes a desenhar
     */
    std::vector<Operation> next_polyline() {
        for (; cursor_ != end_; ++cursor_) {
            const Pos pos = *cursor_;
            if (!maze_[pos].visited) continue;
            for (const Wall* wall : maze_.walls(pos)) {
                const WallPos wp{pos, wall};
                if (maze_.is_open(wp) || is_drawn(wp)) continue;
                std::vector<Operation> ops = trace(wp);
                if (!ops.empty()) return ops;
            }
        }
        return {};
    }

private:
    bool is_drawn(const WallPos& wp) const {
        const Mask* m = drawn_.get(wp.pos);
        return m && (*m & wp.wall->mask()) != 0;
    }

    void mark(const WallPos& wp) {
        if (Mask* m = drawn_.get(wp.pos)) *m |= wp.wall->mask();
    }

    std::vector<Operation> trace(const WallPos& start) {
        std::vector<Operation> ops;
        Follower<T> follower(maze_, start);
        while (auto item = follower.next()) {
            const WallPos& wp = item->first;
            const std::optional<WallPos>& next = item->second;
            if (is_drawn(wp)) break;
            mark(wp);
            mark(maze_.back(wp));

            // O seguidor anda no sentido das paredes: o fim de uma é o início da próxima
            const auto corners = maze_.corners(wp);
            if (ops.empty()) ops.push_back(Operation{Operation::Kind::Move, corners.first});
            ops.push_back(Operation{Operation::Kind::Line, corners.second});

            if (next && !maze_.is_inside(next->pos)) break;
        }
        return ops;
    }

    const Maze<T>& maze_;
    Matrix<Mask> drawn_;
    PositionRange::iterator cursor_;
    PositionRange::iterator end_;
};

/**
 * @brief Todas as operações de desenho das paredes das salas visitadas.
 */
template <typename T>
std::vector<Operation> contour(const Maze<T>& maze) {
    std::vector<Operation> result;
    Visitor<T> visitor(maze);
    for (auto ops = visitor.next_polyline(); !ops.empty(); ops = visitor.next_polyline()) {
        result.insert(result.end(), ops.begin(), ops.end());
    }
    return result;
}

} // namespace polymaze
