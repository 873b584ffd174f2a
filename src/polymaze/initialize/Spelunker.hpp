#pragma once
#include <algorithm>
#include "Common.hpp"
#include "Method.hpp"
#include "polymaze/Tri.hpp"

/**
 * @file Spelunker.hpp
 * @brief Caminhante que executa um programa de instruções a partir de origens aleatórias.
 */

namespace polymaze {
namespace methods {

/**
 * @brief Executa `program` repetidamente a partir de salas sorteadas.
 *
 * O caminhante só avança para salas candidatas ainda não visitadas; cada
 * execução termina quando um avanço é impossível. Ramificações guardam a
 * parede para continuar depois. No final, connect_all() religa as regiões.
 *
 * Em salas triangulares não existe parede oposta: o avanço sai pela parede
 * lateral do lado oposto ao da entrada, de modo que cada execução escava uma
 * faixa horizontal. Ramificações criadas por uma
 * execução que não abriu nenhuma parede são descartadas.
 */
template <typename T>
void spelunker(Maze<T>& maze, Randomizer& rng, Matrix<bool> candidates,
               const Instructions& program) {
    const Matrix<bool> mask = candidates;

    std::vector<WallPos> origins;
    if (auto room = random_room(rng, candidates)) {
        if (auto wp = random_wall(rng, candidates, *room, maze)) origins.push_back(*wp);
    }

    for (;;) {
        WallPos wall_pos;
        if (!origins.empty()) {
            wall_pos = origins.back();
            origins.pop_back();
        } else if (auto room = random_room(rng, candidates)) {
            candidates[*room] = false;
            auto wp = random_wall(rng, candidates, *room, maze);
            if (!wp) continue;
            wall_pos = *wp;
        } else {
            break;
        }

        // Um programa sem avanço nunca terminaria
        bool running = std::find(program.begin(), program.end(), Instruction::Forward)
                       != program.end();
        const std::size_t pending = origins.size();
        bool carved = false;
        while (running) {
            for (Instruction instruction : program) {
                switch (instruction) {
                    case Instruction::Forward: {
                        if (bool* c = candidates.get(wall_pos.pos)) *c = false;
                        const WallPos back = maze.back(wall_pos);
                        const Room<T>* room = maze.rooms().get(back.pos);
                        if (!is_candidate(candidates, back.pos) || room->visited) {
                            running = false;
                            break;
                        }
                        maze.open(wall_pos);
                        carved = true;
                        candidates[back.pos] = false;
                        const Wall* ahead = maze.opposite(back);
                        if (!ahead) {
                            // Sai pelo lado oposto à entrada, mantendo a faixa horizontal
                            const bool from_right = back.wall->dir.col > 0;
                            ahead = tri::is_reversed(back.pos) != from_right ? back.wall->next
                                                                             : back.wall->previous;
                        }
                        wall_pos = WallPos{back.pos, ahead};
                        break;
                    }
                    case Instruction::Left:
                        wall_pos.wall = wall_pos.wall->previous;
                        break;
                    case Instruction::Right:
                        wall_pos.wall = wall_pos.wall->next;
                        break;
                    case Instruction::ForkLeft:
                        origins.push_back(WallPos{wall_pos.pos, wall_pos.wall->previous});
                        break;
                    case Instruction::ForkRight:
                        origins.push_back(WallPos{wall_pos.pos, wall_pos.wall->next});
                        break;
                }
                if (!running) break;
            }
        }
        // Ramificações de uma execução que não escavou nada são descartadas
        if (!carved) origins.resize(pending);
    }

    connect_all(maze, rng, [&](Pos pos) { return is_candidate(mask, pos); });
}

} // namespace methods
} // namespace polymaze
