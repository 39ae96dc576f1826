#include "core/drawer_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace drawerkit {

namespace {

double read_number(const nlohmann::json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

bool read_bool(const nlohmann::json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

}

DrawerConfig sanitized(const DrawerConfig& config) {
    const DrawerConfig defaults{};
    DrawerConfig result = config;
    if (result.direction != Direction::Left && result.direction != Direction::Right) {
        result.direction = defaults.direction;
    }
    if (!std::isfinite(result.animation_duration) || result.animation_duration < 0.0) {
        result.animation_duration = 0.0;
    }
    if (!std::isfinite(result.snap_threshold)) {
        result.snap_threshold = defaults.snap_threshold;
    }
    result.snap_threshold = std::clamp(result.snap_threshold, 0.0, 1.0);
    if (!std::isfinite(result.content_width_ratio) || result.content_width_ratio <= 0.0) {
        result.content_width_ratio = defaults.content_width_ratio;
    }
    result.content_width_ratio = std::min(result.content_width_ratio, 1.0);
    result.edge_drag_margin = std::max(0, result.edge_drag_margin);
    result.tap_slop = std::max(0, result.tap_slop);
    return result;
}

int pixels_from_number(double value, int fallback) {
    if (!std::isfinite(value)) {
        return fallback;
    }
    const double limit = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(std::round(value), 0.0, limit));
}

Direction parse_direction(std::string_view text, Direction fallback) {
    std::string lower(text);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "left") return Direction::Left;
    if (lower == "right") return Direction::Right;
    return fallback;
}

void to_json(nlohmann::json& j, const DrawerConfig& config) {
    j = nlohmann::json{
        {"direction", to_string(config.direction)},
        {"background_dimmed", config.background_dimmed},
        {"animation_duration", config.animation_duration},
        {"snap_threshold", config.snap_threshold},
        {"content_width_ratio", config.content_width_ratio},
        {"edge_drag_margin", config.edge_drag_margin},
        {"tap_slop", config.tap_slop},
    };
}

void from_json(const nlohmann::json& j, DrawerConfig& config) {
    if (!j.is_object()) {
        return;
    }
    auto dir = j.find("direction");
    if (dir != j.end() && dir->is_string()) {
        config.direction = parse_direction(dir->get<std::string>(), config.direction);
    }
    config.background_dimmed = read_bool(j, "background_dimmed", config.background_dimmed);
    config.animation_duration = read_number(j, "animation_duration", config.animation_duration);
    config.snap_threshold = read_number(j, "snap_threshold", config.snap_threshold);
    config.content_width_ratio = read_number(j, "content_width_ratio", config.content_width_ratio);
    config.edge_drag_margin = pixels_from_number(read_number(j, "edge_drag_margin", config.edge_drag_margin), config.edge_drag_margin);
    config.tap_slop = pixels_from_number(read_number(j, "tap_slop", config.tap_slop), config.tap_slop);
    config = sanitized(config);
}

}
