#pragma once

#include <SDL.h>

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace drawerkit::ui {

struct DrawerTokens {
    SDL_Color shadow_color{0, 0, 0, 255};
    double    shadow_opacity = 0.24;
    int       shadow_blur = 8;
    int       shadow_offset_x = 0;
    int       shadow_offset_y = 4;
    SDL_Color background_dimmed_color{0, 0, 0, 255};
    SDL_Color background_clear_color{0, 0, 0, 0};
    double    background_dimmed_opacity = 0.4;
    double    background_clear_opacity = 0.0;

    static const DrawerTokens& Default();
};

// Opacity ceiling of the scrim: the dimmed token when dimming is on, the clear one otherwise.
double background_layer_opacity(const DrawerTokens& tokens, bool background_dimmed);

SDL_Color with_opacity(SDL_Color color, double opacity);

void to_json(nlohmann::json& j, const DrawerTokens& tokens);
void from_json(const nlohmann::json& j, DrawerTokens& tokens);

// Missing or unreadable theme files yield Default().
DrawerTokens load_tokens(const std::filesystem::path& theme_path);

}
