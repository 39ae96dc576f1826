#pragma once

#include <string_view>

#include "core/drawer_config.hpp"

namespace drawerkit::config_settings {

// Reads every DrawerConfig field under `prefix` from the settings file and
// writes the sanitized values back so the file always lists the live config.
DrawerConfig load_drawer_config(std::string_view prefix, const DrawerConfig& defaults = DrawerConfig{});
void save_drawer_config(std::string_view prefix, const DrawerConfig& config);

}
