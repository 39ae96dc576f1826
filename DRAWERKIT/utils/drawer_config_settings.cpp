#include "drawer_config_settings.hpp"

#include <string>

#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace drawerkit::config_settings {

namespace {

struct Keys {
    std::string direction;
    std::string background_dimmed;
    std::string animation_duration;
    std::string snap_threshold;
    std::string content_width_ratio;
    std::string edge_drag_margin;
    std::string tap_slop;
};

Keys keys_for(std::string_view prefix) {
    const std::string base(prefix);
    return Keys{
        base + ".direction",
        base + ".background_dimmed",
        base + ".animation_duration",
        base + ".snap_threshold",
        base + ".content_width_ratio",
        base + ".edge_drag_margin",
        base + ".tap_slop",
    };
}

}

DrawerConfig load_drawer_config(std::string_view prefix, const DrawerConfig& defaults) {
    const Keys keys = keys_for(prefix);
    DrawerConfig config = defaults;

    const std::string direction_text = settings::load_string(keys.direction, to_string(defaults.direction));
    config.direction = parse_direction(direction_text, defaults.direction);
    config.background_dimmed   = settings::load_bool(keys.background_dimmed, defaults.background_dimmed);
    config.animation_duration  = settings::load_number(keys.animation_duration, defaults.animation_duration);
    config.snap_threshold      = settings::load_number(keys.snap_threshold, defaults.snap_threshold);
    config.content_width_ratio = settings::load_number(keys.content_width_ratio, defaults.content_width_ratio);
    config.edge_drag_margin    = pixels_from_number(settings::load_number(keys.edge_drag_margin, defaults.edge_drag_margin),
                                                    defaults.edge_drag_margin);
    config.tap_slop            = pixels_from_number(settings::load_number(keys.tap_slop, defaults.tap_slop), defaults.tap_slop);

    const DrawerConfig clean = sanitized(config);
    if (clean.snap_threshold != config.snap_threshold) {
        log::warn("[DrawerConfig] " + keys.snap_threshold + " out of range; using " + std::to_string(clean.snap_threshold));
    }

    save_drawer_config(prefix, clean);
    return clean;
}

void save_drawer_config(std::string_view prefix, const DrawerConfig& config) {
    const Keys keys = keys_for(prefix);
    settings::save_string(keys.direction, to_string(config.direction));
    settings::save_bool(keys.background_dimmed, config.background_dimmed);
    settings::save_number(keys.animation_duration, config.animation_duration);
    settings::save_number(keys.snap_threshold, config.snap_threshold);
    settings::save_number(keys.content_width_ratio, config.content_width_ratio);
    settings::save_number(keys.edge_drag_margin, config.edge_drag_margin);
    settings::save_number(keys.tap_slop, config.tap_slop);
}

}
