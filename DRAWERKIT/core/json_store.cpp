#include "core/json_store.hpp"

#include <SDL_log.h>

#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "utils/log.hpp"

namespace drawerkit::core {
namespace {

namespace fs = std::filesystem;

struct CachedDocument {
    fs::file_time_type stamp{};
    std::size_t digest = 0;
    nlohmann::json document = nlohmann::json::object();
};

std::size_t digest_of(const std::string& text) {
    return std::hash<std::string>{}(text);
}

void report_failure(const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", message.c_str());
    log::error(message);
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

nlohmann::json parse_object(const fs::path& path, const std::string& text) {
    try {
        nlohmann::json doc = nlohmann::json::parse(text);
        if (doc.is_object()) {
            return doc;
        }
        log::warn("[JsonStore] '" + path.string() + "' does not hold a JSON object; ignoring");
    } catch (const nlohmann::json::exception& e) {
        log::warn("[JsonStore] Failed to parse '" + path.string() + "': " + e.what());
    }
    return nlohmann::json::object();
}

// Writes next to the target and renames over it. Returns an error description,
// empty on success.
std::string replace_file(const fs::path& target, const std::string& text) {
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return "cannot create directory for '" + target.string() + "': " + ec.message();
        }
    }

    fs::path staging = target;
    staging += ".tmp";

    std::optional<fs::perms> carried_perms;
    if (fs::exists(target, ec) && !ec) {
        const fs::file_status st = fs::status(target, ec);
        if (!ec) {
            carried_perms = st.permissions();
        }
    }
    ec.clear();

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return "cannot open '" + staging.string() + "' for writing";
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(staging, ec);
            return "short write to '" + staging.string() + "'";
        }
    }

    if (carried_perms) {
        fs::permissions(staging, *carried_perms, ec);
        ec.clear();
    }

    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        return "cannot move '" + staging.string() + "' over '" + target.string() + "': " + reason;
    }
    return {};
}

}

struct JsonStore::Impl {
    std::mutex mutex;
    std::map<fs::path, CachedDocument> documents;
};

JsonStore& JsonStore::instance() {
    static JsonStore store;
    return store;
}

JsonStore::JsonStore()
    : impl_(new Impl()) {}

JsonStore::~JsonStore() {
    delete impl_;
}

nlohmann::json JsonStore::load(const fs::path& path) {
    std::error_code ec;
    const bool present = fs::exists(path, ec);
    if (ec) {
        report_failure("[JsonStore] Cannot stat '" + path.string() + "': " + ec.message());
        return nlohmann::json::object();
    }
    if (!present) {
        return nlohmann::json::object();
    }

    const fs::file_time_type stamp = fs::last_write_time(path, ec);
    if (ec) {
        report_failure("[JsonStore] Cannot read modification time of '" + path.string() + "': " + ec.message());
        return nlohmann::json::object();
    }
    const std::optional<std::string> text = read_text(path);
    if (!text) {
        report_failure("[JsonStore] Cannot open '" + path.string() + "' for reading");
        return nlohmann::json::object();
    }
    const std::size_t digest = digest_of(*text);

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        const auto it = impl_->documents.find(path);
        if (it != impl_->documents.end() && it->second.stamp == stamp && it->second.digest == digest) {
            return it->second.document;
        }
    }

    CachedDocument entry{stamp, digest, parse_object(path, *text)};
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->documents[path] = entry;
    return entry.document;
}

bool JsonStore::submit(const fs::path& path, const nlohmann::json& data, int indent) {
    const std::string text = data.dump(indent);
    const std::string failure = replace_file(path, text);
    if (!failure.empty()) {
        report_failure("[JsonStore] " + failure);
        return false;
    }

    std::error_code ec;
    fs::file_time_type stamp = fs::last_write_time(path, ec);
    if (ec) {
        stamp = fs::file_time_type::clock::now();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->documents[path] = CachedDocument{stamp, digest_of(text), data};
    }
    log::debug("[JsonStore] Wrote '" + path.string() + "'");
    return true;
}

void JsonStore::forget(const fs::path& path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->documents.erase(path);
}

}
