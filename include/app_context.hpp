#pragma once
#include <stdint.h>
#include "types.hpp"

class Clock;
class ConfigManager;
class SampleSource;
class Display;
class KeyInput;
class LogWriter;

/**
 * @brief Collaborators shared by the application states plus the result of
 * the last finished session.
 *
 * display and keys may be null (headless device, no keypad). The session
 * result is only replaced through publish(), once per finished session.
 */
class AppContext {
public:
    AppContext(Clock* clock, ConfigManager* config, SampleSource* source,
               LogWriter* log_writer, Display* display = nullptr, KeyInput* keys = nullptr);

    Clock* clock() const { return clock_; }
    ConfigManager* config() const { return config_; }
    SampleSource* source() const { return source_; }
    LogWriter* logWriter() const { return log_writer_; }
    Display* display() const { return display_; }
    KeyInput* keys() const { return keys_; }

    void publish(const SessionResult& result);
    bool hasResult() const { return publish_count_ > 0; }
    const SessionResult& lastResult() const { return last_result_; }
    uint32_t publishCount() const { return publish_count_; }

private:
    Clock* clock_;
    ConfigManager* config_;
    SampleSource* source_;
    LogWriter* log_writer_;
    Display* display_;
    KeyInput* keys_;
    SessionResult last_result_;
    uint32_t publish_count_;
};
