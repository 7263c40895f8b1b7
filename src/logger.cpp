#include "../include/logger.hpp"
#include "../include/clock.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>


Logger::Level Logger::min_level_ = Logger::INFO;
bool Logger::flush_on_write_ = true;
Clock* Logger::clock_ = nullptr;

void Logger::begin(const LoggingConfig& cfg, Clock* clock) {
    min_level_ = Logger::INFO;
    if (!cfg.log_level.empty()) {
        if (strcmp(cfg.log_level.c_str(), "DEBUG") == 0) min_level_ = Logger::DEBUG;
        else if (strcmp(cfg.log_level.c_str(), "INFO") == 0) min_level_ = Logger::INFO;
        else if (strcmp(cfg.log_level.c_str(), "WARN") == 0) min_level_ = Logger::WARN;
        else if (strcmp(cfg.log_level.c_str(), "ERROR") == 0) min_level_ = Logger::ERROR;
    }
    flush_on_write_ = cfg.flush_on_write;
    clock_ = clock;
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[128];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // Uptime only, the device has no RTC
    unsigned long ms = clock_ ? (unsigned long)clock_->millis() : 0UL;
    unsigned long seconds = ms / 1000;
    unsigned long minutes = seconds / 60;
    unsigned long hours = minutes / 60;
    char time_buf[24];
    snprintf(time_buf, sizeof(time_buf), "%02lu:%02lu:%02lu.%03lu",
             hours, minutes % 60, seconds % 60, ms % 1000);

    // '#' keeps diagnostics apart from CSV data when both share the serial port
    printf("#[%s] [%s] %s\n", time_buf, level_str, buf);
    if (flush_on_write_) fflush(stdout);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    fflush(stdout);
}

void Logger::shutdown() {
    flush();
    clock_ = nullptr;
}
