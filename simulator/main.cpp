/**
 * @file simulator/main.cpp
 * @brief Simulador SDL2 do solver com rompimento de parede (visualização 2D).
 *
 * Desenha o labirinto de tiles (paredes em verde), um mapa de calor das
 * distâncias BFS a partir de cada canto e a parede escolhida para romper
 * (vermelho). Usa `breach::Solver`, `breach::FrontierEngine` e
 * `breach::BreachEvaluator` sobre uma `breach::Grid`.
 *
 * Como executar:
 * - Habilite o alvo do simulador no CMake: `-DBUILD_SIM=ON`.
 * - Garanta a dependência da SDL2 instalada no sistema (dev headers).
 * - Rode o executável gerado (ex.: `./simulator_app`).
 *
 * Controles:
 * - Setas + Enter: escolher labirinto no menu (título da janela)
 * - ESC: sair
 * - Tab: alterna mapa de calor (início / fim / soma)
 * - D: liga/desliga a rota direta (sem romper parede)
 * - R: gera novo labirinto aleatório
 * - S: salva o labirinto atual em make/
 */
#include <SDL2/SDL.h>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "core/Config.hpp"
#include "core/FrontierEngine.hpp"
#include "core/MazeGen.hpp"
#include "core/MazeText.hpp"
#include "core/Solver.hpp"

using namespace breach;
namespace fs = std::filesystem;

/** @brief Estado calculado para desenho: grade, mapas e resultado. */
struct SimState {
    std::optional<Grid> grid;
    std::optional<DistanceMap> from_start;
    std::optional<DistanceMap> from_end;
    SolveResult result{};
};

static void ensure_dirs() {
    std::error_code ec1, ec2;
    fs::create_directories("maze", ec1);
    fs::create_directories("make", ec2);
    if (ec1 || ec2) std::fprintf(stderr, "Falha ao criar diretorios maze/ make/ (salvar pode falhar)\n");
}

static std::vector<fs::path> list_maze_files() {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory("maze", ec)) return out;
    for (auto& e : fs::directory_iterator("maze", ec)) {
        if (e.is_regular_file() && e.path().extension() == ".txt") out.push_back(e.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

/**
 * @brief Recalcula grade, mapas de distância e resultado para `rows`.
 */
static SimState compute_state(const Rows& rows, const SolverOptions& opt) {
    SimState st;
    st.grid = Grid::from_rows(rows);
    if (!st.grid) return st;
    const Grid& g = *st.grid;
    st.from_start = FrontierEngine::distancesFrom(g, {0, 0});
    st.from_end   = FrontierEngine::distancesFrom(g, {g.height() - 1, g.width() - 1});
    st.result = Solver::solve(g, opt);
    std::printf("Labirinto %dx%d paredes=%d -> %s", g.height(), g.width(), g.wall_count(), to_string(st.result.status));
    if (st.result.ok()) std::printf(" comprimento=%d", st.result.length);
    if (st.result.breach) std::printf(" parede=(%d,%d)", st.result.breach->row, st.result.breach->col);
    std::printf("\n");
    return st;
}

/**
 * @brief Interpola azul (perto) -> amarelo (longe) conforme `t` em [0,1].
 */
static void heat_color(float t, Uint8& r, Uint8& g, Uint8& b) {
    t = std::clamp(t, 0.0f, 1.0f);
    r = static_cast<Uint8>(30 + 220 * t);
    g = static_cast<Uint8>(60 + 160 * t);
    b = static_cast<Uint8>(200 - 170 * t);
}

/**
 * @brief Valor do mapa de calor no modo escolhido (0=início, 1=fim, 2=soma).
 */
static std::optional<int> heat_value(const SimState& st, Position p, int mode) {
    if (mode == 0) return st.from_start->at(p);
    if (mode == 1) return st.from_end->at(p);
    auto a = st.from_start->at(p);
    auto b = st.from_end->at(p);
    if (!a || !b) return std::nullopt;
    return *a + *b;
}

/**
 * @brief Desenha tiles, mapa de calor, cantos e a parede rompida.
 *
 * @param ren Renderer SDL2.
 * @param st Estado calculado.
 * @param mode Modo do mapa de calor.
 * @param ox Offset X em pixels.
 * @param oy Offset Y em pixels.
 * @param cell Tamanho do tile em pixels.
 */
static void draw_state(SDL_Renderer* ren, const SimState& st, int mode, int ox, int oy, int cell) {
    const Grid& g = *st.grid;
    int max_v = 1;
    for (int i = 0; i < g.size(); ++i) {
        if (auto v = heat_value(st, g.position(i), mode)) max_v = std::max(max_v, *v);
    }
    for (int r = 0; r < g.height(); ++r) {
        for (int c = 0; c < g.width(); ++c) {
            const Position p{r, c};
            SDL_Rect rect{ ox + c*cell, oy + r*cell, cell - 1, cell - 1 };
            if (g.is_wall(p)) {
                SDL_SetRenderDrawColor(ren, 0, 140, 0, 255);
            } else if (auto v = heat_value(st, p, mode)) {
                Uint8 cr, cg, cb;
                heat_color(static_cast<float>(*v) / static_cast<float>(max_v), cr, cg, cb);
                SDL_SetRenderDrawColor(ren, cr, cg, cb, 255);
            } else {
                SDL_SetRenderDrawColor(ren, 60, 60, 60, 255); // piso inalcançável
            }
            SDL_RenderFillRect(ren, &rect);
        }
    }
    // cantos
    SDL_SetRenderDrawColor(ren, 255, 255, 255, 255);
    SDL_Rect s{ ox + cell/4, oy + cell/4, cell/2, cell/2 };
    SDL_Rect e{ ox + (g.width()-1)*cell + cell/4, oy + (g.height()-1)*cell + cell/4, cell/2, cell/2 };
    SDL_RenderDrawRect(ren, &s);
    SDL_RenderDrawRect(ren, &e);
    if (st.result.breach) {
        SDL_SetRenderDrawColor(ren, 220, 0, 0, 255);
        SDL_Rect b{ ox + st.result.breach->col*cell, oy + st.result.breach->row*cell, cell - 1, cell - 1 };
        SDL_RenderFillRect(ren, &b);
    }
}

static std::string status_title(const SimState& st, int mode, const SolverOptions& opt) {
    static const char* modes[3] = { "inicio", "fim", "soma" };
    char title[200];
    if (!st.grid) {
        std::snprintf(title, sizeof(title), "Breach Simulator - labirinto invalido");
    } else if (st.result.ok()) {
        std::snprintf(title, sizeof(title), "Breach Simulator - %dx%d comprimento=%d calor=%s direta=%s",
                      st.grid->height(), st.grid->width(), st.result.length, modes[mode], opt.direct_path ? "on" : "off");
    } else {
        std::snprintf(title, sizeof(title), "Breach Simulator - %dx%d sem solucao calor=%s direta=%s",
                      st.grid->height(), st.grid->width(), modes[mode], opt.direct_path ? "on" : "off");
    }
    return std::string(title);
}

/**
 * @brief Ponto de entrada do simulador 2D com SDL2.
 *
 * @return 0 em término normal; 1 se ocorrer erro de inicialização SDL.
 */
int main(int argc, char** argv) {
    (void)argc; (void)argv;
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }
    const int win_w = 800, win_h = 700;
    SDL_Window* win = SDL_CreateWindow("Breach Simulator", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, win_w, win_h, SDL_WINDOW_SHOWN);
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

    const int OX = 40, OY = 40;
    const int H = 21, W = 29; // padrão para o aleatório
    ensure_dirs();
    std::random_device rd;

    // Menu: [0] Aleatório ... depois arquivos encontrados em maze/
    auto files = list_maze_files();
    std::vector<std::string> items;
    items.push_back("Aleatorio (gerar e salvar em make/)");
    for (auto& p : files) items.push_back(p.filename().string());
    int sel = 0;

    Rows rows;
    bool running = true;
    bool choosing = true;
    SDL_SetWindowTitle(win, ("Escolha: " + items[sel]).c_str());
    while (choosing && running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type != SDL_KEYDOWN) continue;
            const SDL_Keycode k = e.key.keysym.sym;
            if (k == SDLK_ESCAPE) running = false;
            else if (k == SDLK_UP) { sel = (sel + (int)items.size() - 1) % (int)items.size(); SDL_SetWindowTitle(win, ("Escolha: " + items[sel]).c_str()); }
            else if (k == SDLK_DOWN) { sel = (sel + 1) % (int)items.size(); SDL_SetWindowTitle(win, ("Escolha: " + items[sel]).c_str()); }
            else if (k == SDLK_RETURN || k == SDLK_KP_ENTER) {
                bool loaded = false;
                if (sel > 0) {
                    loaded = load_maze_file(files[sel-1].string(), &rows);
                    if (!loaded) std::fprintf(stderr, "Falha ao carregar %s, gerando aleatorio.\n", files[sel-1].string().c_str());
                }
                if (!loaded) {
                    rows = generate_maze(H, W, rd(), (H * W) / 20);
                    char fname[128];
                    std::snprintf(fname, sizeof(fname), "maze_%dx%d_%ld.txt", H, W, (long)std::time(nullptr));
                    const fs::path out = fs::path("make") / fname;
                    if (save_maze_file(out.string(), rows)) std::printf("Salvo: %s\n", out.string().c_str());
                    else std::fprintf(stderr, "Falha ao salvar %s\n", out.string().c_str());
                }
                choosing = false;
            }
        }
        SDL_SetRenderDrawColor(ren, 0, 0, 0, 255);
        SDL_RenderClear(ren);
        SDL_RenderPresent(ren);
    }

    SolverOptions opt{};
    int mode = 2;
    SimState st;
    if (running) st = compute_state(rows, opt);

    while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) running = false;
            if (e.type != SDL_KEYDOWN) continue;
            switch (e.key.keysym.sym) {
                case SDLK_ESCAPE: running = false; break;
                case SDLK_TAB: mode = (mode + 1) % 3; break;
                case SDLK_d:
                    opt.direct_path = !opt.direct_path;
                    st = compute_state(rows, opt);
                    break;
                case SDLK_r:
                    rows = generate_maze(H, W, rd(), (H * W) / 20);
                    st = compute_state(rows, opt);
                    break;
                case SDLK_s: {
                    char fname[128];
                    std::snprintf(fname, sizeof(fname), "maze_%dx%d_%ld.txt", (int)rows.size(), (int)rows.front().size(), (long)std::time(nullptr));
                    const fs::path out = fs::path("make") / fname;
                    if (!save_maze_file(out.string(), rows)) std::fprintf(stderr, "Falha ao salvar %s\n", out.string().c_str());
                    break;
                }
                default: break;
            }
        }

        SDL_SetRenderDrawColor(ren, 0, 0, 0, 255);
        SDL_RenderClear(ren);
        if (st.grid) {
            const int cell = std::max(4, std::min({ BREACH_CFG_SIM_CELL_PX,
                                                    (win_w - 2*OX) / st.grid->width(),
                                                    (win_h - 2*OY) / st.grid->height() }));
            draw_state(ren, st, mode, OX, OY, cell);
        }
        SDL_SetWindowTitle(win, status_title(st, mode, opt).c_str());
        SDL_RenderPresent(ren);
    }
    SDL_DestroyRenderer(ren);
    SDL_DestroyWindow(win);
    SDL_Quit();
    return 0;
}
