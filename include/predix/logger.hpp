#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <deque>
#include <nlohmann/json.hpp>

namespace predix {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    // Accepts "debug", "info", "warn", "error", "fatal"; unknown names keep the current level
    void set_level(const std::string& name) {
        if (name == "debug") set_level(LogLevel::DEBUG);
        else if (name == "info") set_level(LogLevel::INFO);
        else if (name == "warn") set_level(LogLevel::WARN);
        else if (name == "error") set_level(LogLevel::ERROR);
        else if (name == "fatal") set_level(LogLevel::FATAL);
    }

    void set_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(filename, std::ios::app);
    }

    // Silences stdout; file output and the recent-entry buffer keep working
    void set_console(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    template<typename... Args>
    void log(LogLevel level, const std::string& component, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        std::ostringstream body;
        (body << ... << args);

        std::ostringstream oss;
        oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
        oss << " [" << level_to_string(level) << "] [" << component << "] " << body.str();

        std::string msg = oss.str();

        if (console_) {
            (level >= LogLevel::ERROR ? std::cerr : std::cout) << msg << std::endl;
        }

        if (file_.is_open()) {
            file_ << msg << std::endl;
            file_.flush();
        }

        std::ostringstream ts;
        ts << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
        recent_.push_back({
            {"timestamp", ts.str()},
            {"level", level_to_name(level)},
            {"name", component},
            {"message", body.str()}
        });
        if (recent_.size() > max_recent_) {
            recent_.pop_front();
        }
    }

    template<typename... Args>
    void debug(const std::string& component, Args&&... args) { log(LogLevel::DEBUG, component, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(const std::string& component, Args&&... args) { log(LogLevel::INFO, component, std::forward<Args>(args)...); }

    template<typename... Args>
    void warn(const std::string& component, Args&&... args) { log(LogLevel::WARN, component, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(const std::string& component, Args&&... args) { log(LogLevel::ERROR, component, std::forward<Args>(args)...); }

    template<typename... Args>
    void fatal(const std::string& component, Args&&... args) { log(LogLevel::FATAL, component, std::forward<Args>(args)...); }

    // Most recent entries, oldest first
    nlohmann::json recent(size_t limit = 200) const {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json out = nlohmann::json::array();
        size_t start = recent_.size() > limit ? recent_.size() - limit : 0;
        for (size_t i = start; i < recent_.size(); ++i) {
            out.push_back(recent_[i]);
        }
        return out;
    }

private:
    Logger() : level_(LogLevel::INFO) {}

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
        }
        return "UNKNOWN";
    }

    static std::string level_to_name(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::FATAL: return "fatal";
        }
        return "unknown";
    }

    LogLevel level_;
    bool console_ = true;
    std::ofstream file_;
    std::deque<nlohmann::json> recent_;
    size_t max_recent_ = 200;
    mutable std::mutex mutex_;
};

} // namespace predix
