// log.cpp
#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

#include "errors.hpp"

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_write_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "?";
}

}  // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    std::string t = name;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (t == "debug") {
        return LogLevel::Debug;
    }
    if (t == "info") {
        return LogLevel::Info;
    }
    if (t == "warn" || t == "warning") {
        return LogLevel::Warn;
    }
    if (t == "error") {
        return LogLevel::Error;
    }
    if (t == "off" || t == "none") {
        return LogLevel::Off;
    }
    throw ConfigError("Unknown log level: " + name);
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << component << "] " << level_tag(level) << ": " << message << "\n";
}
