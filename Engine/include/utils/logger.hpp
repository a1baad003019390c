#pragma once

#include <core/types.hpp>
#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Annex {

/**
 * @brief Thread-safe logging utility for the engine.
 *
 * Messages below the current threshold are dropped. The threshold is
 * process-wide and follows the most recent log_level handed to a build or
 * to annex_log_verbosity().
 */
class Logger {
public:
    enum class Level {
        Fatal,
        Error,
        Warning,
        Info,
        Step
    };

    static void set_threshold(LogLevel level) {
        threshold().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    static LogLevel get_threshold() {
        return static_cast<LogLevel>(threshold().load(std::memory_order_relaxed));
    }

    static bool enabled(Level level) {
        return required(level) <= threshold().load(std::memory_order_relaxed);
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Fatal:   color = "\033[1;31m"; prefix = "[annex] FATAL ";  break; // Bold red
            case Level::Error:   color = "\033[0;31m"; prefix = "[annex] ERROR ";  break; // Red
            case Level::Warning: color = "\033[1;33m"; prefix = "[annex] WARN ";   break; // Yellow
            case Level::Info:    color = "\033[0;36m"; prefix = "[annex] ";        break; // Cyan
            case Level::Step:    color = "\033[0;35m"; prefix = "[annex] >>> ";    break; // Magenta
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void fatal(const std::string& msg) { log(Level::Fatal, msg); }
    static void error(const std::string& msg) { log(Level::Error, msg); }
    static void warn(const std::string& msg)  { log(Level::Warning, msg); }
    static void info(const std::string& msg)  { log(Level::Info, msg); }
    static void step(const std::string& msg)  { log(Level::Step, msg); }

private:
    static std::atomic<int>& threshold() {
        static std::atomic<int> value{static_cast<int>(LogLevel::Warning)};
        return value;
    }

    static int required(Level level) {
        switch (level) {
            case Level::Fatal:   return static_cast<int>(LogLevel::Fatal);
            case Level::Error:   return static_cast<int>(LogLevel::Error);
            case Level::Warning: return static_cast<int>(LogLevel::Warning);
            case Level::Info:
            case Level::Step:    return static_cast<int>(LogLevel::Info);
        }
        return static_cast<int>(LogLevel::Info);
    }
};

} // namespace Annex
