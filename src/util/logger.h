// viralclust - Logger utility
// Console messages filtered by verbosity, plus a full trace file per run

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace viralclust {

enum class Verbosity { Quiet, Normal, Verbose };

enum class LogLevel { Detail, Info, Warning, Error };

class Logger {
public:
    // Quiet: warnings and errors only. Verbose: info and detail as well.
    Verbosity console_level = Verbosity::Quiet;

    Logger() : Logger("", "") {}

    explicit Logger(const std::string& command, const std::string& version = "")
        : command_(command),
          version_(version),
          colour_(isatty(fileno(stderr)) != 0),
          start_(std::chrono::steady_clock::now()) {}

    ~Logger() {
        if (trace_.is_open()) {
            trace_ << "\n" << rule() << "\n"
                   << "Finished " << wall_clock() << " after "
                   << std::fixed << std::setprecision(1) << seconds() << "s\n";
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Everything logged from here on is mirrored to path, whatever the
    // console verbosity
    bool open_trace(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace_.open(path);
        if (!trace_.is_open()) return false;
        trace_ << "viralclust " << (command_.empty() ? "run" : command_);
        if (!version_.empty()) trace_ << " (" << version_ << ")";
        trace_ << "\nStarted " << wall_clock() << "\n" << rule() << "\n";
        return true;
    }

    void detail(const std::string& msg) { emit(LogLevel::Detail, msg); }
    void info(const std::string& msg) { emit(LogLevel::Info, msg); }
    void warn(const std::string& msg) { emit(LogLevel::Warning, msg); }
    void error(const std::string& msg) { emit(LogLevel::Error, msg); }

    // Trace-only structure: headings, key/value metrics, decisions, tables

    void section(const std::string& title) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("\n## " + title);
    }

    void metric(const std::string& name, int value) {
        metric(name, std::to_string(value));
    }

    void metric(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("  " + name + " = " + value);
    }

    void decision(const std::string& what, const std::string& outcome,
                  const std::string& subject = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string line = "  -> " + what + ": " + outcome;
        if (!subject.empty()) line += " (" + subject + ")";
        trace(line);
    }

    void table(const std::string& title, const std::vector<std::string>& columns,
               const std::vector<std::vector<std::string>>& rows) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace("  [" + title + "]");
        trace("  " + tab_joined(columns));
        for (const auto& row : rows) trace("  " + tab_joined(row));
    }

private:
    struct LevelStyle {
        const char* name;
        const char* colour;
        Verbosity shown_from;
    };

    static LevelStyle style(LogLevel level) {
        switch (level) {
            case LogLevel::Detail:  return {"DEBUG", "\033[36m", Verbosity::Verbose};
            case LogLevel::Info:    return {"INFO", "\033[1m", Verbosity::Normal};
            case LogLevel::Warning: return {"WARNING", "\033[33m", Verbosity::Quiet};
            case LogLevel::Error:   return {"ERROR", "\033[31m", Verbosity::Quiet};
        }
        return {"", "", Verbosity::Quiet};
    }

    // Console: "viralclust INFO -- 2024-01-01 12:00:00 -- message"
    // Trace:   "[  12.3s] INFO message"
    void emit(LogLevel level, const std::string& msg) {
        LevelStyle s = style(level);
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_level >= s.shown_from) {
            std::cerr << "viralclust ";
            if (colour_) std::cerr << s.colour << s.name << "\033[0m";
            else std::cerr << s.name;
            std::cerr << " -- " << wall_clock() << " -- " << msg << "\n";
        }
        std::ostringstream line;
        line << "[" << std::setw(6) << std::fixed << std::setprecision(1) << seconds() << "s] "
             << s.name << " " << msg;
        trace(line.str());
    }

    void trace(const std::string& line) {
        if (!trace_.is_open()) return;
        trace_ << line << "\n";
        trace_.flush();
    }

    double seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

    static std::string wall_clock() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
        return buf;
    }

    static std::string rule() { return std::string(60, '-'); }

    static std::string tab_joined(const std::vector<std::string>& cells) {
        std::string out;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i) out += '\t';
            out += cells[i];
        }
        return out;
    }

    std::string command_;
    std::string version_;
    bool colour_;
    std::chrono::steady_clock::time_point start_;
    std::ofstream trace_;
    std::mutex mutex_;
};

}  // namespace viralclust
