/**
 * @file viewer/main.cpp
 * @brief Visualizador SDL2 de labirintos poligonais.
 *
 * Gera um labirinto, desenha o contorno das paredes em verde, o caminho
 * (A*) do canto superior esquerdo ao inferior direito em vermelho e,
 * opcionalmente, o mapa de calor de caminhos aleatórios.
 *
 * Como executar:
 * - Habilite o alvo no CMake: `-DPOLYMAZE_BUILD_VIEWER=ON`.
 * - Garanta a SDL2 instalada no sistema (dev headers).
 * - `./polymaze_viewer [formato] [largura] [altura] [método] [semente]`
 *   ex.: `./polymaze_viewer hex 24 16 winding 7`
 * - A semente também pode vir de `POLYMAZE_SEED`.
 *
 * Controles:
 * - ESC: sair
 * - R: gerar outro labirinto (próxima semente)
 * - Espaço: mostrar/ocultar a solução
 * - H: mostrar/ocultar o mapa de calor
 * - K: guardar um snapshot em memória
 * - L: restaurar o snapshot guardado
 */
#include <SDL2/SDL.h>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include "polymaze/Config.hpp"
#include "polymaze/Follower.hpp"
#include "polymaze/HeatMap.hpp"
#include "polymaze/Log.hpp"
#include "polymaze/Snapshot.hpp"
#include "polymaze/Walk.hpp"
#include "polymaze/initialize/Initialize.hpp"

using namespace polymaze;

namespace {

/// Parâmetros da linha de comando (valores inválidos caem no padrão).
struct Options {
    Shape shape{Shape::Quad};
    int width{POLYMAZE_CFG_DEFAULT_WIDTH};
    int height{POLYMAZE_CFG_DEFAULT_HEIGHT};
    Method method{};
    uint64_t seed{POLYMAZE_CFG_DEFAULT_SEED};
};

bool parse_int(const char* text, long min, long max, long& out) {
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v < min || v > max) return false;
    out = v;
    return true;
}

Options parse_options(int argc, char** argv) {
    Options opt;
    if (auto shape = shape_from_walls(POLYMAZE_CFG_DEFAULT_SHAPE)) opt.shape = *shape;

    if (const char* env = std::getenv("POLYMAZE_SEED")) {
        if (auto seed = parse_seed(env)) {
            opt.seed = *seed;
        } else {
            POLYMAZE_WARN("VIEW", "invalid POLYMAZE_SEED '%s', using %llu", env,
                          static_cast<unsigned long long>(opt.seed));
        }
    }

    long value = 0;
    if (argc > 1) {
        if (auto shape = shape_from_name(argv[1])) opt.shape = *shape;
        else POLYMAZE_WARN("VIEW", "unknown shape '%s' (tri, quad, hex)", argv[1]);
    }
    if (argc > 2) {
        if (parse_int(argv[2], 1, 200, value)) opt.width = static_cast<int>(value);
        else POLYMAZE_WARN("VIEW", "invalid width '%s'", argv[2]);
    }
    if (argc > 3) {
        if (parse_int(argv[3], 1, 200, value)) opt.height = static_cast<int>(value);
        else POLYMAZE_WARN("VIEW", "invalid height '%s'", argv[3]);
    }
    if (argc > 4) {
        if (auto method = parse_method(argv[4])) opt.method = *method;
        else POLYMAZE_WARN("VIEW", "unknown method '%s'", argv[4]);
    }
    if (argc > 5) {
        if (auto seed = parse_seed(argv[5])) opt.seed = *seed;
        else POLYMAZE_WARN("VIEW", "invalid seed '%s'", argv[5]);
    }
    return opt;
}

/**
 * @brief Converte coordenadas físicas do labirinto em pixels da janela.
 */
struct Projection {
    float scale{1.0f};
    float ox{0.0f};
    float oy{0.0f};
    ViewBox box{};

    static Projection fit(const ViewBox& box, int win_w, int win_h, int margin) {
        Projection p;
        p.box = box;
        const float avail_w = static_cast<float>(win_w - 2 * margin);
        const float avail_h = static_cast<float>(win_h - 2 * margin);
        if (box.width > 0.0f && box.height > 0.0f) {
            p.scale = std::min(avail_w / box.width, avail_h / box.height);
        }
        p.ox = margin + 0.5f * (avail_w - p.scale * box.width);
        p.oy = margin + 0.5f * (avail_h - p.scale * box.height);
        return p;
    }

    SDL_Point operator()(PhysicalPos pos) const {
        return SDL_Point{static_cast<int>(ox + (pos.x - box.corner.x) * scale),
                         static_cast<int>(oy + (pos.y - box.corner.y) * scale)};
    }
};

/// Desenha as polilinhas do contorno (Move inicia, Line continua).
void draw_contour(SDL_Renderer* ren, const std::vector<Operation>& ops, const Projection& proj) {
    SDL_SetRenderDrawColor(ren, 0, 200, 0, 255);
    SDL_Point last{0, 0};
    for (const Operation& op : ops) {
        const SDL_Point p = proj(op.pos);
        if (op.kind == Operation::Kind::Line) SDL_RenderDrawLine(ren, last.x, last.y, p.x, p.y);
        last = p;
    }
}

/// Liga os centros das salas do caminho.
void draw_path(SDL_Renderer* ren, const Maze<>& maze, const std::vector<Pos>& rooms,
               const Projection& proj) {
    SDL_SetRenderDrawColor(ren, 220, 40, 40, 255);
    for (std::size_t i = 1; i < rooms.size(); ++i) {
        const SDL_Point a = proj(maze.center(rooms[i - 1]));
        const SDL_Point b = proj(maze.center(rooms[i]));
        SDL_RenderDrawLine(ren, a.x, a.y, b.x, b.y);
    }
    if (!rooms.empty()) {
        const int d = std::max(2, static_cast<int>(proj.scale * 0.25f));
        for (Pos pos : {rooms.front(), rooms.back()}) {
            const SDL_Point c = proj(maze.center(pos));
            SDL_Rect r{c.x - d, c.y - d, 2 * d, 2 * d};
            SDL_RenderFillRect(ren, &r);
        }
    }
}

/// Quadrado no centro de cada sala, com intensidade proporcional ao uso.
void draw_heatmap(SDL_Renderer* ren, const Maze<>& maze, const HeatMap& heat, const Projection& proj) {
    uint32_t peak = 0;
    for (Pos pos : heat.positions()) peak = std::max(peak, heat[pos]);
    if (peak == 0) return;
    const int d = std::max(1, static_cast<int>(proj.scale * 0.4f));
    for (Pos pos : heat.positions()) {
        if (heat[pos] == 0) continue;
        const auto level = static_cast<Uint8>(40 + (215u * heat[pos]) / peak);
        SDL_SetRenderDrawColor(ren, level, level / 2, 0, 255);
        const SDL_Point c = proj(maze.center(pos));
        SDL_Rect r{c.x - d, c.y - d, 2 * d, 2 * d};
        SDL_RenderFillRect(ren, &r);
    }
}

/**
 * @brief Estado exibido: labirinto, solução e mapa de calor já calculados.
 */
struct Scene {
    Maze<> maze;
    std::vector<Operation> contour;
    std::vector<Pos> solution;
    HeatMap heat;

    explicit Scene(const Options& opt) : maze(opt.shape, opt.width, opt.height) {}

    void refresh(Randomizer& rng) {
        contour = polymaze::contour(maze);
        solution.clear();
        if (auto path = walk(maze, {0, 0}, {maze.width() - 1, maze.height() - 1})) {
            solution = path->to_vector();
        }
        heat = heatmap(maze, random_pairs(maze.width(), maze.height(), 200, rng));
    }
};

void generate(Scene& scene, const Options& opt, uint64_t seed) {
    scene.maze = Maze<>(opt.shape, opt.width, opt.height);
    Lfsr rng(seed);
    initialize(scene.maze, opt.method, rng);
    scene.refresh(rng);
    POLYMAZE_LOG("VIEW", "%s %dx%d %s seed=%llu: path=%zu rooms, %zu contour ops",
                 shape_name(opt.shape), opt.width, opt.height, method_name(opt.method).c_str(),
                 static_cast<unsigned long long>(seed), scene.solution.size(), scene.contour.size());
}

} // namespace

/**
 * @brief Inicializa SDL2, gera o primeiro labirinto e executa o loop principal.
 * @return 0 em término normal; 1 se ocorrer erro de inicialização SDL.
 */
int main(int argc, char** argv) {
    const Options opt = parse_options(argc, argv);

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }
    const int win_w = 900, win_h = 700;
    SDL_Window* win = SDL_CreateWindow("polymaze", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                       win_w, win_h, SDL_WINDOW_SHOWN);
    if (!win) {
        std::fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_Renderer* ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!ren) {
        std::fprintf(stderr, "SDL_CreateRenderer error: %s\n", SDL_GetError());
        SDL_DestroyWindow(win);
        SDL_Quit();
        return 1;
    }

    uint64_t seed = opt.seed;
    Scene scene(opt);
    generate(scene, opt, seed);
    const Projection proj = Projection::fit(scene.maze.viewbox(), win_w, win_h, 30);

    std::vector<uint8_t> kept;
    bool show_solution = true;
    bool show_heat = false;
    bool running = true;
    while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type != SDL_KEYDOWN) continue;
            switch (e.key.keysym.sym) {
                case SDLK_ESCAPE: running = false; break;
                case SDLK_SPACE: show_solution = !show_solution; break;
                case SDLK_h: show_heat = !show_heat; break;
                case SDLK_r: generate(scene, opt, ++seed); break;
                case SDLK_k:
                    kept = encode_snapshot(scene.maze);
                    POLYMAZE_LOG("VIEW", "snapshot kept (%zu bytes)", kept.size());
                    break;
                case SDLK_l: {
                    if (kept.empty()) {
                        POLYMAZE_WARN("VIEW", "no snapshot kept (press K first)");
                    } else if (restore_snapshot(scene.maze, kept)) {
                        Lfsr rng(seed);
                        scene.refresh(rng);
                    }
                    break;
                }
                default: break;
            }
        }

        SDL_SetRenderDrawColor(ren, 0, 0, 0, 255);
        SDL_RenderClear(ren);
        if (show_heat) draw_heatmap(ren, scene.maze, scene.heat, proj);
        draw_contour(ren, scene.contour, proj);
        if (show_solution) draw_path(ren, scene.maze, scene.solution, proj);

        char title[160];
        std::snprintf(title, sizeof(title), "polymaze - %s %dx%d %s seed=%llu path=%zu%s",
                      shape_name(opt.shape), opt.width, opt.height, method_name(opt.method).c_str(),
                      static_cast<unsigned long long>(seed), scene.solution.size(),
                      show_heat ? " [heat]" : "");
        SDL_SetWindowTitle(win, title);
        SDL_RenderPresent(ren);
    }
    SDL_DestroyRenderer(ren);
    SDL_DestroyWindow(win);
    SDL_Quit();
    return 0;
}
