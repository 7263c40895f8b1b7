#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct Sample {
    uint64_t timestamp_us = 0;
    std::vector<float> values;
};

struct ChannelResult {
    float min = 0.0f;
    float mean = 0.0f;
    float max = 0.0f;
};

typedef std::vector<ChannelResult> ResultSet;

enum class SessionState {
    IDLE,
    RUNNING,
    COMPLETED,
    ABORTED,
    FAILED
};

struct SessionResult {
    SessionState state = SessionState::IDLE;
    double elapsed_s = 0.0;
    uint32_t sample_count = 0;
    ResultSet values;
    // false for a degenerate session (no sample taken), values is empty then
    bool valid = false;
    // oldest-first ring buffer snapshot per channel, only when plotting is enabled
    std::vector<std::vector<float> > plots;
};

const char* sessionStateToString(SessionState state);
