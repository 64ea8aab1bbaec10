#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <cstdlib>
#include <cstring>

namespace Lexicode {

/**
 * @brief Thread-safe logging utility for the lexicon builder and validator.
 *
 * Messages below the configured minimum level are dropped. The minimum level
 * is read once from LEXICODE_LOG_LEVEL (error|warning|info|stat) and can be
 * changed at runtime, e.g. by tests that want a silent run.
 */
class Logger {
public:
    enum class Level {
        Stat,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (rank(level) < rank(s.min_level)) return;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Stat:    color = "\033[0;37m"; prefix = "    ";  break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = (level == Level::Error || level == Level::Warning) ? *s.err : *s.out;
        if (s.color) out << color << prefix << message << "\033[0m" << std::endl;
        else out << prefix << message << std::endl;
    }

    static void stat(const std::string& msg)    { log(Level::Stat, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static void set_min_level(Level level) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.min_level = level;
    }

    static Level min_level() {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.min_level;
    }

    /**
     * @brief Redirect both channels to one stream with colours off (used to capture output).
     */
    static void set_sink(std::ostream& out) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.out = &out;
        s.err = &out;
        s.color = false;
    }

    static void reset_sink() {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.out = &std::cout;
        s.err = &std::cerr;
        s.color = true;
    }

private:
    struct State {
        std::mutex mutex;
        Level min_level = level_from_env();
        std::ostream* out = &std::cout;
        std::ostream* err = &std::cerr;
        bool color = true;
    };

    static State& state() {
        static State s;
        return s;
    }

    static int rank(Level level) {
        switch (level) {
            case Level::Stat:    return 0;
            case Level::Info:
            case Level::Step:
            case Level::Success: return 1;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
        }
        return 1;
    }

    static Level level_from_env() {
        const char* env = std::getenv("LEXICODE_LOG_LEVEL");
        if (!env) return Level::Stat;
        if (std::strcmp(env, "error") == 0)   return Level::Error;
        if (std::strcmp(env, "warning") == 0) return Level::Warning;
        if (std::strcmp(env, "info") == 0)    return Level::Info;
        return Level::Stat;
    }
};

} // namespace Lexicode
