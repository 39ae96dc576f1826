#include "utils/settings.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/json_store.hpp"
#include "utils/log.hpp"

namespace drawerkit::settings {

namespace {

struct SettingsFile {
    std::mutex mutex;
    std::filesystem::path path{"drawerkit_settings.json"};
    nlohmann::json document = nlohmann::json::object();
    bool loaded = false;

    // Callers hold the mutex.
    nlohmann::json& data() {
        if (!loaded) {
            loaded = true;
            document = core::JsonStore::instance().load(path);
            if (!document.is_object()) {
                document = nlohmann::json::object();
            }
        }
        return document;
    }

    void invalidate() {
        loaded = false;
        document = nlohmann::json::object();
    }
};

SettingsFile& settings_file() {
    static SettingsFile file;
    return file;
}

std::vector<std::string> key_parts(std::string_view key) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= key.size()) {
        const std::size_t dot = key.find('.', start);
        const std::size_t stop = (dot == std::string_view::npos) ? key.size() : dot;
        if (stop > start) {
            parts.emplace_back(key.substr(start, stop - start));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

const nlohmann::json* lookup(const nlohmann::json& root, std::string_view key) {
    const std::vector<std::string> parts = key_parts(key);
    if (parts.empty()) {
        return nullptr;
    }
    const nlohmann::json* node = &root;
    for (const std::string& part : parts) {
        if (!node->is_object() || !node->contains(part)) {
            return nullptr;
        }
        node = &(*node)[part];
    }
    return node;
}

void assign(std::string_view key, nlohmann::json value) {
    const std::vector<std::string> parts = key_parts(key);
    if (parts.empty()) {
        return;
    }
    SettingsFile& file = settings_file();
    std::lock_guard<std::mutex> lock(file.mutex);
    nlohmann::json* node = &file.data();
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        nlohmann::json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = std::move(value);
    if (!core::JsonStore::instance().submit(file.path, file.document)) {
        log::warn("[settings] '" + std::string(key) + "' kept in memory only");
    }
}

// Copies the value under the lock so callers can inspect it freely.
nlohmann::json fetch(std::string_view key) {
    SettingsFile& file = settings_file();
    std::lock_guard<std::mutex> lock(file.mutex);
    const nlohmann::json* node = lookup(file.data(), key);
    return node ? *node : nlohmann::json();
}

}

bool load_bool(std::string_view key, bool default_value) {
    const nlohmann::json value = fetch(key);
    return value.is_boolean() ? value.get<bool>() : default_value;
}

void save_bool(std::string_view key, bool value) {
    assign(key, value);
}

double load_number(std::string_view key, double default_value) {
    const nlohmann::json value = fetch(key);
    if (value.is_number_float()) {
        return value.get<double>();
    }
    if (value.is_number_integer()) {
        return static_cast<double>(value.get<std::int64_t>());
    }
    if (!value.is_string()) {
        return default_value;
    }

    // Hand-edited files sometimes quote numbers.
    const std::string text = value.get<std::string>();
    if (text.empty()) {
        return default_value;
    }
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(text.c_str(), &end);
    if (errno == 0 && end == text.c_str() + text.size()) {
        return parsed;
    }
    log::warn("[settings] '" + std::string(key) + "' is not a number: \"" + text + "\"");
    return default_value;
}

void save_number(std::string_view key, double value) {
    assign(key, value);
}

std::string load_string(std::string_view key, std::string_view default_value) {
    const nlohmann::json value = fetch(key);
    return value.is_string() ? value.get<std::string>() : std::string(default_value);
}

void save_string(std::string_view key, std::string_view value) {
    assign(key, std::string(value));
}

void set_settings_path(const std::filesystem::path& path) {
    SettingsFile& file = settings_file();
    std::lock_guard<std::mutex> lock(file.mutex);
    if (file.path == path) {
        return;
    }
    file.path = path;
    file.invalidate();
}

std::filesystem::path settings_path() {
    SettingsFile& file = settings_file();
    std::lock_guard<std::mutex> lock(file.mutex);
    return file.path;
}

void reload() {
    SettingsFile& file = settings_file();
    std::lock_guard<std::mutex> lock(file.mutex);
    core::JsonStore::instance().forget(file.path);
    file.invalidate();
}

}
