#include "utils.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <unistd.h>

namespace logger {

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::NOTICE: return "NOTICE";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "";
}

void Logger::log(LogLevel level, const char* format, va_list args) {
    if (!enabled(level)) return;
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char stamp[32];
    std::tm tmNow;
    localtime_r(&now, &tmNow);
    std::strftime(stamp, sizeof(stamp), "%Y/%m/%d %H:%M:%S", &tmNow);
    std::lock_guard<std::mutex> lock(mtx_);
    fprintf(fp_, "%s [%s] ", levelName(level), stamp);
    vfprintf(fp_, format, args);
    fprintf(fp_, "\n");
    fflush(fp_);
}

} // namespace logger

void error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list copy;
    va_copy(copy, args);
    logger::Logger::getInstance().log(logger::LogLevel::ERROR, format, args);
    va_end(args);
    char buf[4096];
    vsnprintf(buf, sizeof(buf), format, copy);
    va_end(copy);
    throw std::runtime_error(buf);
}

void warning(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logger::Logger::getInstance().log(logger::LogLevel::WARNING, format, args);
    va_end(args);
}

void notice(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logger::Logger::getInstance().log(logger::LogLevel::NOTICE, format, args);
    va_end(args);
}

void debug(const char* format, ...) {
    auto& lg = logger::Logger::getInstance();
    if (!lg.enabled(logger::LogLevel::DEBUG)) return;
    va_list args;
    va_start(args, format);
    lg.log(logger::LogLevel::DEBUG, format, args);
    va_end(args);
}

std::string trim(const std::string& str) {
    size_t st = 0, ed = str.size();
    while (st < ed && std::isspace(static_cast<unsigned char>(str[st]))) st++;
    while (ed > st && std::isspace(static_cast<unsigned char>(str[ed - 1]))) ed--;
    return str.substr(st, ed - st);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

void split(std::vector<std::string>& tokens, const std::string& str, char delim, bool trimTokens) {
    tokens.clear();
    size_t st = 0;
    while (true) {
        size_t ed = str.find(delim, st);
        std::string tok = str.substr(st, ed == std::string::npos ? std::string::npos : ed - st);
        tokens.push_back(trimTokens ? trim(tok) : tok);
        if (ed == std::string::npos) break;
        st = ed + 1;
    }
}

bool checkOutputWritable(const std::string& path) {
    if (path.empty()) return false;
    if (::access(path.c_str(), F_OK) == 0) {
        return ::access(path.c_str(), W_OK) == 0;
    }
    size_t slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, std::max<size_t>(slash, 1));
    return ::access(dir.c_str(), W_OK) == 0;
}
