#pragma once

#include <string>
#include <cstdarg>
#include "config_manager.hpp"

class Clock;

class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };
    static void begin(const LoggingConfig& cfg, Clock* clock = nullptr);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static void flush();
    static void shutdown();
private:
    static Level min_level_;
    static bool flush_on_write_;
    static Clock* clock_;
    static void write_log(Level level, const char* fmt, va_list args);
};
