#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Databrain {

/**
 * @brief Thread-safe logging utility for the engine.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (static_cast<int>(level) < min_level_.load()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        // Warnings and errors go to stderr so tool output on stdout stays parseable
        std::ostream& out = level >= Level::Warning ? std::cerr : std::clog;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_level(Level level) { min_level_.store(static_cast<int>(level)); }
    static Level level() { return static_cast<Level>(min_level_.load()); }

    static std::optional<Level> parse_level(std::string_view name) {
        if (name == "debug")   return Level::Debug;
        if (name == "info")    return Level::Info;
        if (name == "step")    return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error")   return Level::Error;
        return std::nullopt;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static inline std::atomic<int> min_level_{static_cast<int>(Level::Info)};
};

} // namespace Databrain
