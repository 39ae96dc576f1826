#include <SDL.h>

#include <filesystem>
#include <string>
#include <string_view>

#include "core/drawer_config.hpp"
#include "core/drawer_presenter.hpp"
#include "core/drawer_transition_controller.hpp"
#include "ui/drawer_input_router.hpp"
#include "ui/drawer_tokens.hpp"
#include "ui/slide_over_panel.hpp"
#include "utils/drawer_config_settings.hpp"
#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace {

struct DemoOptions {
    std::filesystem::path settings_path{"drawerkit_settings.json"};
    std::filesystem::path theme_path{"drawerkit_theme.json"};
    bool right = false;
};

DemoOptions parse_options(int argc, char* argv[]) {
    DemoOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i] ? argv[i] : "";
        if (arg == "--settings" && i + 1 < argc) {
            options.settings_path = argv[++i];
        } else if (arg == "--theme" && i + 1 < argc) {
            options.theme_path = argv[++i];
        } else if (arg == "--right") {
            options.right = true;
        } else {
            drawerkit::log::warn("[Main] Ignoring unknown argument '" + std::string(arg) + "'");
        }
    }
    return options;
}

void draw_background(SDL_Renderer* renderer, int w, int h) {
    SDL_SetRenderDrawColor(renderer, 34, 86, 160, 255);
    SDL_RenderClear(renderer);
    SDL_SetRenderDrawColor(renderer, 52, 104, 180, 255);
    for (int y = 0; y < h; y += 48) {
        SDL_Rect stripe{0, y, w, 24};
        SDL_RenderFillRect(renderer, &stripe);
    }
}

void draw_content(SDL_Renderer* renderer, const SDL_Rect& rect) {
    SDL_SetRenderDrawColor(renderer, 214, 48, 49, 255);
    SDL_RenderFillRect(renderer, &rect);
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    for (int i = 0; i < 6; ++i) {
        SDL_Rect row{rect.x + 24, rect.y + 32 + i * 40, rect.w - 48, 16};
        SDL_RenderFillRect(renderer, &row);
    }
}

}

int main(int argc, char* argv[]) {
    drawerkit::log::info("[Main] Starting drawer demo...");
    const DemoOptions options = parse_options(argc, argv);

    drawerkit::settings::set_settings_path(options.settings_path);
    drawerkit::DrawerConfig defaults;
    if (options.right) {
        defaults.direction = drawerkit::Direction::Right;
    }
    defaults.background_dimmed = true;
    const drawerkit::DrawerConfig config = drawerkit::config_settings::load_drawer_config("drawer", defaults);
    const drawerkit::ui::DrawerTokens tokens = drawerkit::ui::load_tokens(options.theme_path);
    drawerkit::log::info("[Main] Drawer opens from the " + std::string(drawerkit::to_string(config.direction)) +
                         ", snap threshold " + std::to_string(config.snap_threshold));

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        drawerkit::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow("drawerkit", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          480, 800, SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        drawerkit::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        drawerkit::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    {
        drawerkit::ui::SlideOverPanel panel(config, tokens);
        panel.set_render_function(draw_content);
        drawerkit::DrawerTransitionController controller(config, &panel);
        drawerkit::DrawerPresenter presenter(controller);
        drawerkit::ui::DrawerInputRouter router(controller, panel);

        presenter.set_on_state_changed([](bool expanded) {
            drawerkit::log::info(std::string("[Main] Drawer is now ") + (expanded ? "open" : "closed"));
        });

        int screen_w = 0;
        int screen_h = 0;
        SDL_GetRendererOutputSize(renderer, &screen_w, &screen_h);
        panel.layout(screen_w, screen_h);

        Uint64 last = SDL_GetPerformanceCounter();
        const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());
        bool running = true;
        while (running) {
            SDL_Event e;
            while (SDL_PollEvent(&e)) {
                if (e.type == SDL_QUIT) {
                    running = false;
                    break;
                }
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    SDL_GetRendererOutputSize(renderer, &screen_w, &screen_h);
                    panel.layout(screen_w, screen_h);
                }
                if (router.handle_event(e)) {
                    continue;
                }
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0) {
                    switch (e.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        running = false;
                        break;
                    case SDLK_SPACE:
                        if (presenter.is_presented()) {
                            presenter.dismiss(true);
                        } else {
                            presenter.present(true);
                        }
                        break;
                    case SDLK_d:
                        controller.set_background_dimmed(!controller.config().background_dimmed);
                        panel.set_background_dimmed(controller.config().background_dimmed);
                        break;
                    default:
                        break;
                    }
                }
            }

            const Uint64 now = SDL_GetPerformanceCounter();
            const double dt = static_cast<double>(now - last) / frequency;
            last = now;
            panel.update(dt);

            draw_background(renderer, screen_w, screen_h);
            panel.render(renderer);
            SDL_RenderPresent(renderer);
        }

        controller.on_disappear();
        drawerkit::DrawerConfig saved = config;
        saved.background_dimmed = controller.config().background_dimmed;
        drawerkit::config_settings::save_drawer_config("drawer", saved);
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    drawerkit::log::info("[Main] Shutdown complete.");
    return 0;
}
