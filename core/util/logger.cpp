#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace metatot {

namespace {

Logger::Level initialLevel() {
    const char* env = std::getenv("META_TOT_LOG_LEVEL");
    return env ? Logger::parseLevel(env) : Logger::Level::Info;
}

std::atomic<int>& levelSlot() {
    static std::atomic<int> level{static_cast<int>(initialLevel())};
    return level;
}

const char* prefixFor(Logger::Level level) {
    switch (level) {
        case Logger::Level::Debug:   return "DEBUG";
        case Logger::Level::Info:    return "INFO ";
        case Logger::Level::Warning: return "WARN ";
        case Logger::Level::Error:   return "ERROR";
        case Logger::Level::Off:     break;
    }
    return "";
}

} // namespace

void Logger::log(Level level, const std::string& component, const std::string& message) {
    if (level == Level::Off || static_cast<int>(level) < levelSlot().load()) return;

    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::cerr << std::put_time(&tm, "%H:%M:%S") << " "
              << prefixFor(level) << " [" << component << "] "
              << message << std::endl;
}

void Logger::setLevel(Level level) {
    levelSlot().store(static_cast<int>(level));
}

Logger::Level Logger::level() {
    return static_cast<Level>(levelSlot().load());
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "off" || lower == "none") return Level::Off;
    return Level::Info;
}

} // namespace metatot
