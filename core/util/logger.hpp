#pragma once

#include <string>

namespace metatot {

/// Thread-safe logging utility for the planning engine.
/// Writes to stderr so the CLI can keep stdout for JSON results.
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3,
        Off = 4
    };

    static void log(Level level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& msg) { log(Level::Debug, component, msg); }
    static void info(const std::string& component, const std::string& msg)  { log(Level::Info, component, msg); }
    static void warn(const std::string& component, const std::string& msg)  { log(Level::Warning, component, msg); }
    static void error(const std::string& component, const std::string& msg) { log(Level::Error, component, msg); }

    /// Minimum level that gets written. Defaults to META_TOT_LOG_LEVEL or Info.
    static void setLevel(Level level);
    static Level level();

    /// Parse "debug" / "info" / "warn" / "error" / "off". Unknown names map to Info.
    static Level parseLevel(const std::string& name);
};

} // namespace metatot
