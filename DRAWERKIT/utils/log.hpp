#pragma once

#include <functional>
#include <string>

namespace drawerkit::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Receives every line that passes the level filter, before it is written.
using Capture = std::function<void(Level, const std::string&)>;

void set_level(Level level);
Level level();
bool enabled(Level level);

// Mirrors output into a file. An empty path closes the current file.
bool set_file(const std::string& path, bool append);
void set_capture(Capture capture);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

const char* to_string(Level level);

}
