#pragma once
#include <iostream>
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}
enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

// Diagnostics go to stderr so command output on stdout stays clean.
class Logger {
public:
    static LogLevel level;
    static bool colour;

    static void setLevel(LogLevel newLevel) {
        level = newLevel;
    }

    // Off when stderr is redirected.
    static void setColour(bool enabled) {
        colour = enabled;
    }

    static void debug(const std::string& msg) {
        if (level >= LogLevel::DEBUG) {
            emit(ansi::gray, "[DEBUG] ", msg);
        }
    }

    static void info(const std::string& msg) {
        if (level >= LogLevel::INFO) {
            emit(ansi::white, "[INFO] ", msg);
        }
    }

    static void warn(const std::string& msg) {
        if (level >= LogLevel::WARN) {
            emit(ansi::yellow, "[WARN] ", msg);
        }
    }

    static void error(const std::string& msg) {
        if (level >= LogLevel::ERROR) {
            emit(ansi::red, "[ERROR] ", msg);
        }
    }

private:
    static void emit(const std::string& code, const char* tag, const std::string& msg);
};
