#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace logger {

enum class LogLevel : int { DEBUG = 0, NOTICE = 1, WARNING = 2, ERROR = 3 };

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    bool enabled(LogLevel level) const {
        return static_cast<int>(level) >= static_cast<int>(level_);
    }
    void setStream(FILE* fp) { fp_ = fp; }

    void log(LogLevel level, const char* format, va_list args);

private:
    Logger() = default;
    LogLevel level_ = LogLevel::NOTICE;
    FILE* fp_ = stderr;
    std::mutex mtx_;
};

} // namespace logger

// Logs and throws std::runtime_error with the formatted message
[[noreturn]] void error(const char* format, ...);
void warning(const char* format, ...);
void notice(const char* format, ...);
void debug(const char* format, ...);

// String helpers
std::string trim(const std::string& str);
std::string toLower(std::string str);
void split(std::vector<std::string>& tokens, const std::string& str, char delim, bool trimTokens = false);
bool checkOutputWritable(const std::string& path);
