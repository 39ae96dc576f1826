#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "core/drawer_types.hpp"

namespace drawerkit {

inline constexpr double kDefaultSnapThreshold = 0.225;

struct DrawerConfig {
    Direction direction = Direction::Left;
    bool background_dimmed = false;
    // Seconds. 0 settles immediately.
    double animation_duration = 0.0;
    double snap_threshold = kDefaultSnapThreshold;
    double content_width_ratio = 0.9;
    // Pixels from the drawer's edge where a press may start the presenting gesture.
    int edge_drag_margin = 24;
    // Pointer travel below which a press/release on the scrim counts as a tap.
    int tap_slop = 6;
};

DrawerConfig sanitized(const DrawerConfig& config);

// Non-finite values give `fallback`; others are rounded and clamped to [0, INT_MAX].
int pixels_from_number(double value, int fallback);

Direction parse_direction(std::string_view text, Direction fallback);

void to_json(nlohmann::json& j, const DrawerConfig& config);
void from_json(const nlohmann::json& j, DrawerConfig& config);

}
