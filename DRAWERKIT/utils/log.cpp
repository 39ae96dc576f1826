#include "utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace drawerkit::log {
namespace {

struct Logger {
    std::mutex mutex;
    Level level = Level::Info;
    bool configured = false;
    std::unique_ptr<std::ofstream> file;
    Capture capture;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

Logger& logger() {
    static Logger instance;
    return instance;
}

bool truthy(const char* value) {
    if (!value) {
        return false;
    }
    switch (value[0]) {
    case '1': case 'y': case 'Y': case 't': case 'T':
        return true;
    default:
        return false;
    }
}

Level level_from_name(std::string name, Level fallback) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return fallback;
}

bool open_file_locked(Logger& state, const std::string& path, bool append) {
    state.file.reset();
    if (path.empty()) {
        return true;
    }
    auto out = std::make_unique<std::ofstream>(path, append ? (std::ios::out | std::ios::app)
                                                           : (std::ios::out | std::ios::trunc));
    if (!out->is_open()) {
        return false;
    }
    state.file = std::move(out);
    return true;
}

// Environment is read lazily so static initialization order never matters.
void configure_locked(Logger& state) {
    if (state.configured) {
        return;
    }
    state.configured = true;
    if (const char* name = std::getenv("DRAWERKIT_LOG_LEVEL")) {
        state.level = level_from_name(name, state.level);
    }
    const char* path = std::getenv("DRAWERKIT_LOG_FILE");
    if (path && *path && !open_file_locked(state, path, truthy(std::getenv("DRAWERKIT_LOG_APPEND")))) {
        std::cerr << "[WARN] could not open log file '" << path << "'\n";
    }
}

void write(Level lvl, const std::string& message) {
    Logger& state = logger();
    Capture capture;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        configure_locked(state);
        if (static_cast<int>(lvl) > static_cast<int>(state.level)) {
            return;
        }
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.origin).count();
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "%.3f", secs);
        const std::string line = std::string("[") + to_string(lvl) + "] +" + stamp + "s: " + message + '\n';

        std::ostream& os = (lvl == Level::Error) ? std::cerr : std::cout;
        os << line << std::flush;
        if (state.file) {
            *state.file << line << std::flush;
        }
        capture = state.capture;
    }
    if (capture) {
        capture(lvl, message);
    }
}

}

const char* to_string(Level level) {
    switch (level) {
    case Level::Error: return "ERROR";
    case Level::Warn:  return "WARN";
    case Level::Info:  return "INFO";
    case Level::Debug: return "DEBUG";
    }
    return "INFO";
}

void set_level(Level lvl) {
    Logger& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    configure_locked(state);
    state.level = lvl;
}

Level level() {
    Logger& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    configure_locked(state);
    return state.level;
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) <= static_cast<int>(level());
}

bool set_file(const std::string& path, bool append) {
    Logger& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    configure_locked(state);
    return open_file_locked(state, path, append);
}

void set_capture(Capture capture) {
    Logger& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.capture = std::move(capture);
}

void reset_time_origin() {
    Logger& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write(Level::Error, message); }
void warn(const std::string& message)  { write(Level::Warn, message); }
void info(const std::string& message)  { write(Level::Info, message); }
void debug(const std::string& message) { write(Level::Debug, message); }

}
