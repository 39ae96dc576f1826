#include "ui/drawer_tokens.hpp"

#include <algorithm>
#include <cmath>

#include <nlohmann/json.hpp>

#include "core/json_store.hpp"
#include "utils/log.hpp"

namespace drawerkit::ui {

namespace {

Uint8 clamp_channel(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    return static_cast<Uint8>(std::clamp(std::lround(value), 0L, 255L));
}

nlohmann::json color_to_json(const SDL_Color& color) {
    return nlohmann::json::array({color.r, color.g, color.b, color.a});
}

SDL_Color color_from_json(const nlohmann::json& j, SDL_Color fallback) {
    if (!j.is_array() || j.size() < 3 || j.size() > 4) {
        return fallback;
    }
    for (const auto& channel : j) {
        if (!channel.is_number()) {
            return fallback;
        }
    }
    SDL_Color color{};
    color.r = clamp_channel(j[0].get<double>());
    color.g = clamp_channel(j[1].get<double>());
    color.b = clamp_channel(j[2].get<double>());
    color.a = (j.size() == 4) ? clamp_channel(j[3].get<double>()) : 255;
    return color;
}

double opacity_from_json(const nlohmann::json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::clamp(value, 0.0, 1.0);
}

int int_from_json(const nlohmann::json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<int>();
}

}

const DrawerTokens& DrawerTokens::Default() {
    static const DrawerTokens tokens{};
    return tokens;
}

double background_layer_opacity(const DrawerTokens& tokens, bool background_dimmed) {
    return background_dimmed ? tokens.background_dimmed_opacity : tokens.background_clear_opacity;
}

SDL_Color with_opacity(SDL_Color color, double opacity) {
    if (!std::isfinite(opacity)) {
        opacity = 0.0;
    }
    color.a = clamp_channel(static_cast<double>(color.a) * std::clamp(opacity, 0.0, 1.0));
    return color;
}

void to_json(nlohmann::json& j, const DrawerTokens& tokens) {
    j = nlohmann::json{
        {"shadow_color", color_to_json(tokens.shadow_color)},
        {"shadow_opacity", tokens.shadow_opacity},
        {"shadow_blur", tokens.shadow_blur},
        {"shadow_offset_x", tokens.shadow_offset_x},
        {"shadow_offset_y", tokens.shadow_offset_y},
        {"background_dimmed_color", color_to_json(tokens.background_dimmed_color)},
        {"background_clear_color", color_to_json(tokens.background_clear_color)},
        {"background_dimmed_opacity", tokens.background_dimmed_opacity},
        {"background_clear_opacity", tokens.background_clear_opacity},
    };
}

void from_json(const nlohmann::json& j, DrawerTokens& tokens) {
    if (!j.is_object()) {
        return;
    }
    if (auto it = j.find("shadow_color"); it != j.end()) {
        tokens.shadow_color = color_from_json(*it, tokens.shadow_color);
    }
    if (auto it = j.find("background_dimmed_color"); it != j.end()) {
        tokens.background_dimmed_color = color_from_json(*it, tokens.background_dimmed_color);
    }
    if (auto it = j.find("background_clear_color"); it != j.end()) {
        tokens.background_clear_color = color_from_json(*it, tokens.background_clear_color);
    }
    tokens.shadow_opacity            = opacity_from_json(j, "shadow_opacity", tokens.shadow_opacity);
    tokens.background_dimmed_opacity = opacity_from_json(j, "background_dimmed_opacity", tokens.background_dimmed_opacity);
    tokens.background_clear_opacity  = opacity_from_json(j, "background_clear_opacity", tokens.background_clear_opacity);
    tokens.shadow_blur     = std::max(0, int_from_json(j, "shadow_blur", tokens.shadow_blur));
    tokens.shadow_offset_x = int_from_json(j, "shadow_offset_x", tokens.shadow_offset_x);
    tokens.shadow_offset_y = int_from_json(j, "shadow_offset_y", tokens.shadow_offset_y);
}

DrawerTokens load_tokens(const std::filesystem::path& theme_path) {
    DrawerTokens tokens = DrawerTokens::Default();
    const nlohmann::json theme = drawerkit::core::JsonStore::instance().load(theme_path);
    auto it = theme.find("drawer");
    if (it == theme.end()) {
        log::debug("[DrawerTokens] No drawer section in '" + theme_path.string() + "'; using defaults");
        return tokens;
    }
    from_json(*it, tokens);
    return tokens;
}

}
