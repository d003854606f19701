#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string



enum class LogLevel { Debug, Info, Warn, Quiet };

// printf-style formatting shared by error() and the log helpers
std::string vstrfmt(const char* fmt, va_list args);
std::string strfmt(const char* fmt, ...);

void error(const std::string& msg, const char* file, int line, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)

// process wide threshold, set once by the CLI
void set_log_level(LogLevel level);
LogLevel log_level();
void log_msg(LogLevel level, const char* fmt, ...);

#define LOG_DEBUG(msg, ...) log_msg(LogLevel::Debug, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...)  log_msg(LogLevel::Info, msg, ##__VA_ARGS__)
#define LOG_WARN(msg, ...)  log_msg(LogLevel::Warn, msg, ##__VA_ARGS__)
