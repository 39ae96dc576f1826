#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace drawerkit::core {

// Process-wide JSON file cache. Reads are memoized by mtime and content hash,
// writes go through a temp file and a rename so readers never see a partial file.
class JsonStore {
public:
    static JsonStore& instance();

    nlohmann::json load(const std::filesystem::path& path);
    bool submit(const std::filesystem::path& path, const nlohmann::json& data, int indent = 4);
    void forget(const std::filesystem::path& path);

private:
    JsonStore();
    ~JsonStore();

    JsonStore(const JsonStore&) = delete;
    JsonStore& operator=(const JsonStore&) = delete;

    struct Impl;
    Impl* impl_;
};

}
