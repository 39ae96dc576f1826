#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace drawerkit::settings {

// Keys are dotted paths into a nested JSON object ("drawer.snap_threshold").
bool load_bool(std::string_view key, bool default_value);
void save_bool(std::string_view key, bool value);
double load_number(std::string_view key, double default_value);
void save_number(std::string_view key, double value);
std::string load_string(std::string_view key, std::string_view default_value);
void save_string(std::string_view key, std::string_view value);

void set_settings_path(const std::filesystem::path& path);
std::filesystem::path settings_path();

// Drops the in-memory cache so the next read goes back to disk.
void reload();

}
