#include "logger.hpp"

LogLevel Logger::level = LogLevel::INFO;
bool Logger::colour = true;

void Logger::emit(const std::string& code, const char* tag, const std::string& msg) {
    if (colour) {
        std::cerr << code << tag << msg << ansi::reset << "\n";
    } else {
        std::cerr << tag << msg << "\n";
    }
}
