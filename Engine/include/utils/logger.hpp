#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Regulator {

/**
 * @brief Thread-safe logging utility.
 *
 * Console output is colored by level. An optional file sink receives the same
 * messages uncolored, each prefixed with a local timestamp and level name.
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
        std::lock_guard<std::mutex> lock(mutex());
        if (static_cast<int>(level) < static_cast<int>(min_level())) return;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        auto& out = (level == Level::Error || level == Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;

        auto& file = sink();
        if (file.is_open()) {
            file << timestamp() << " - regulator - " << level_name(level) << " - " << message << '\n';
            file.flush();
        }
    }

    /**
     * @brief Append all subsequent messages to a log file.
     * @throws std::runtime_error if the file cannot be opened
     */
    static void open_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex());
        auto& file = sink();
        if (file.is_open()) file.close();
        file.open(path, std::ios::app);
        if (!file) throw std::runtime_error("Cannot open log file: " + path);
    }

    static void close_file() {
        std::lock_guard<std::mutex> lock(mutex());
        if (sink().is_open()) sink().close();
    }

    static void set_min_level(Level level) {
        std::lock_guard<std::mutex> lock(mutex());
        min_level() = level;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static std::ofstream& sink() {
        static std::ofstream file;
        return file;
    }

    static Level& min_level() {
        static Level level = Level::Info;
        return level;
    }

    static const char* level_name(Level level) {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO";
            case Level::Step:    return "INFO";
            case Level::Success: return "INFO";
            case Level::Warning: return "WARNING";
            case Level::Error:   return "ERROR";
        }
        return "INFO";
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
};

} // namespace Regulator
