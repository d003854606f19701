#include "lib.hpp"
#include <atomic>
#include <iostream>

namespace {
    std::atomic<LogLevel> g_level{LogLevel::Info};

    const char* prefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "[.] ";
            case LogLevel::Info:  return "[*] ";
            case LogLevel::Warn:  return "[!] ";
            case LogLevel::Quiet: return "";
        }
        return "";
    }
}

// Two pass vsnprintf: the first call with a null buffer returns the size needed.
std::string vstrfmt(const char* fmt, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    return std::string(buffer.data(), required_size);
}

std::string strfmt(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vstrfmt(fmt, args);
    va_end(args);
    return out;
}

// Throws std::runtime_error prefixed with the file and line of the call site.
void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = vstrfmt(msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << text;
    throw std::runtime_error(ss.str());
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void log_msg(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Quiet || level < g_level.load()) return;
    va_list args;
    va_start(args, fmt);
    std::string text = vstrfmt(fmt, args);
    va_end(args);
    std::cerr << prefix(level) << text << std::endl;
}
