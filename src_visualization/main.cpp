// Formicarium with SDL2 visualization
// Drives the same AntSimulation as the headless runner

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <omp.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <variant>

#include "../src_headless/common/conf.hpp"
#include "../src_headless/common/config.hpp"
#include "../src_headless/common/simulation.hpp"
#include "color.hpp"

// ============================================================================
// View Class - SDL2 Visualization
// ============================================================================

class View {
   public:
    SDL_Window* window;
    SDL_Renderer* renderer;
    TTF_Font* font;
    bool running;
    bool paused;
    bool reported;
    int simulation_speed;

    Conf conf;
    AntSimulation sim;
    int tile_side;

    explicit View(const Conf& conf)
        : window(nullptr),
          renderer(nullptr),
          font(nullptr),
          running(true),
          paused(false),
          reported(false),
          simulation_speed(1),
          conf(conf),
          sim(conf),
          tile_side(std::max(1, static_cast<int>(conf.env.tile_side))) {}

    ~View() {
        cleanup();
    }

    bool init() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
            return false;
        }

        if (TTF_Init() < 0) {
            std::cerr << "TTF init failed: " << TTF_GetError() << std::endl;
            return false;
        }

        const int width = conf.env.dimension.x * tile_side;
        const int height = conf.env.dimension.y * tile_side;
        window = SDL_CreateWindow(
            "Formicarium!",
            SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            width, height,
            SDL_WINDOW_SHOWN);

        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer) {
            renderer = SDL_CreateRenderer(window, -1, 0);
        }
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        const char* font_paths[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            nullptr};

        for (int i = 0; font_paths[i] != nullptr; ++i) {
            font = TTF_OpenFont(font_paths[i], 14);
            if (font)
                break;
        }

        if (!font) {
            std::cerr << "Warning: Could not load font, HUD will be disabled" << std::endl;
        }

        return true;
    }

    void cleanup() {
        if (font)
            TTF_CloseFont(font);
        if (renderer)
            SDL_DestroyRenderer(renderer);
        if (window)
            SDL_DestroyWindow(window);
        font = nullptr;
        renderer = nullptr;
        window = nullptr;
        TTF_Quit();
        SDL_Quit();
    }

    void handleEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                    case SDLK_q:
                        running = false;
                        break;
                    case SDLK_SPACE:
                        paused = !paused;
                        break;
                    case SDLK_r:
                        sim.initialize();
                        reported = false;
                        break;
                    case SDLK_UP:
                        simulation_speed = std::min(simulation_speed * 2, 64);
                        break;
                    case SDLK_DOWN:
                        simulation_speed = std::max(simulation_speed / 2, 1);
                        break;
                }
            }
        }
    }

    void setColor(const rgb& c) {
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    }

    // Square of the given side centered in the tile at `loc`
    SDL_Rect centeredRect(const Location& loc, int side) {
        const int offset = (tile_side - side) / 2;
        SDL_Rect rect = {loc.x * tile_side + offset, loc.y * tile_side + offset, side, side};
        return rect;
    }

    void renderPhero(const Location& loc, const PheroState& phero) {
        if (!conf.is_visible(phero.scent))
            return;
        const double ratio = static_cast<double>(phero.strength.length()) /
                             std::max<std::uint16_t>(1, conf.ants.max_phero_concentration);
        const int side = std::max(1, static_cast<int>(tile_side * std::min(ratio, 0.5)));
        SDL_Rect rect = centeredRect(loc, side);
        setColor(phero_color(phero.scent, phero.strength.length(), conf.ants.max_phero_concentration));
        SDL_RenderFillRect(renderer, &rect);
    }

    void renderNest(const Location& loc, const NestState&) {
        if (!conf.is_visible(EntityKind::NEST))
            return;
        SDL_Rect outer = centeredRect(loc, tile_side);
        SDL_Rect inner = centeredRect(loc, tile_side / 2);
        setColor(nest_color());
        SDL_RenderDrawRect(renderer, &outer);
        SDL_RenderFillRect(renderer, &inner);
    }

    void renderMorsel(const Location& loc, const MorselState& morsel) {
        if (!conf.is_visible(EntityKind::MORSEL))
            return;
        // Morsel shrinks as its food is taken away
        const double ratio = conf.morsels.storage > 0
                                 ? static_cast<double>(morsel.supply.length()) / conf.morsels.storage
                                 : 0.0;
        const int side = std::max(1, static_cast<int>(tile_side * std::min(ratio, 1.0)));
        SDL_Rect outer = centeredRect(loc, side);
        SDL_Rect inner = centeredRect(loc, std::max(1, side / 2));
        setColor(morsel_color());
        SDL_RenderDrawRect(renderer, &outer);
        SDL_RenderFillRect(renderer, &inner);
    }

    void renderGrid() {
        const int width = conf.env.dimension.x * tile_side;
        const int height = conf.env.dimension.y * tile_side;
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        for (int i = 0; i <= conf.env.dimension.y; i++) {
            SDL_RenderDrawLine(renderer, 0, i * tile_side, width, i * tile_side);
        }
        for (int i = 0; i <= conf.env.dimension.x; i++) {
            SDL_RenderDrawLine(renderer, i * tile_side, 0, i * tile_side, height);
        }
    }

    void render() {
        const Color3& bg = conf.env.background;
        SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, 255);
        SDL_RenderClear(renderer);

        if (conf.env.grid_visible)
            renderGrid();

        // Pheromones below the nest and the morsels
        for (const Tile& tile : sim.environment().all_tiles()) {
            for (const Entity& e : tile.entities) {
                if (const PheroState* phero = std::get_if<PheroState>(&e.state))
                    renderPhero(e.location, *phero);
            }
        }
        for (const Tile& tile : sim.environment().all_tiles()) {
            for (const Entity& e : tile.entities) {
                if (const NestState* nest = std::get_if<NestState>(&e.state))
                    renderNest(e.location, *nest);
                else if (const MorselState* morsel = std::get_if<MorselState>(&e.state))
                    renderMorsel(e.location, *morsel);
            }
        }

        if (conf.ants.visible) {
            const int side = std::max(1, tile_side * 8 / 10);
            for (const Ant& ant : sim.environment().ants()) {
                SDL_Rect rect = centeredRect(ant.location(), side);
                setColor(activity_color(ant.activity()));
                SDL_RenderFillRect(renderer, &rect);
            }
        }

        renderHUD();

        SDL_RenderPresent(renderer);
    }

    void renderHUD() {
        if (!font)
            return;

        SDL_Color white = {255, 255, 255, 255};
        SDL_Color yellow = {255, 255, 0, 255};
        const bool complete = sim.is_simulation_over();

        char text[256];
        snprintf(text, sizeof(text), "Collected: %llu/%llu",
                 static_cast<unsigned long long>(sim.storage()),
                 static_cast<unsigned long long>(sim.total_storage()));
        renderText(text, 10, 10, complete ? yellow : white);

        snprintf(text, sizeof(text), "Generation: %llu | Speed: %dx | %s",
                 static_cast<unsigned long long>(sim.environment().generation()),
                 simulation_speed, paused ? "PAUSED" : "RUNNING");
        renderText(text, 10, 30, white);
    }

    void renderText(const char* text, int x, int y, SDL_Color color) {
        SDL_Surface* surface = TTF_RenderText_Blended(font, text, color);
        if (surface) {
            SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
            if (texture) {
                SDL_Rect dst = {x, y, surface->w, surface->h};
                SDL_RenderCopy(renderer, texture, nullptr, &dst);
                SDL_DestroyTexture(texture);
            }
            SDL_FreeSurface(surface);
        }
    }

    void run() {
        // fps 0: as fast as possible, one generation per frame
        const int frame_delay = conf.fps > 0 ? 1000 / conf.fps : 0;

        std::cout << "=== Formicarium (Visualization) ===" << std::endl;
        std::cout << "Grid: " << conf.env.dimension.x << "x" << conf.env.dimension.y << std::endl;
        std::cout << "Ants: " << conf.ants.count << std::endl;
        std::cout << "Morsels: " << conf.morsels.count << std::endl;
        std::cout << "Food per morsel: " << conf.morsels.storage << std::endl;
        std::cout << "OpenMP threads: " << omp_get_max_threads() << std::endl;
        std::cout << std::endl;
        std::cout << "Controls:" << std::endl;
        std::cout << "  SPACE - Pause/Resume" << std::endl;
        std::cout << "  R     - Reset simulation" << std::endl;
        std::cout << "  UP    - Increase speed" << std::endl;
        std::cout << "  DOWN  - Decrease speed" << std::endl;
        std::cout << "  Q/ESC - Quit" << std::endl;
        std::cout << "===================================" << std::endl;

        while (running) {
            Uint32 frame_start = SDL_GetTicks();

            handleEvents();

            if (!paused && !sim.is_simulation_over()) {
                for (int i = 0; i < simulation_speed; ++i) {
                    sim.tick();
                    if (sim.is_simulation_over())
                        break;
                }
            }

            if (sim.is_simulation_over() && !reported) {
                std::cout << "Simulation over after " << sim.environment().generation() << " generations"
                          << std::endl;
                reported = true;
            }

            render();

            Uint32 frame_time = SDL_GetTicks() - frame_start;
            if (frame_time < static_cast<Uint32>(frame_delay)) {
                SDL_Delay(frame_delay - frame_time);
            }
        }
    }
};

int main(int argc, char* argv[]) {
    const std::string conf_path = argc > 1 ? argv[1] : DEFAULT_CONF_PATH;
    const Conf conf = load_conf(conf_path);

    try {
        View view(conf);
        if (!view.init()) {
            std::cerr << "Failed to initialize view" << std::endl;
            return 1;
        }

        view.run();
    } catch (const std::exception& e) {
        std::cerr << "Simulation aborted: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
