#pragma once

// Due-time bookkeeping for one cooperative activity of the acquisition loop.
// The owner polls isDue() against its Clock and calls the activity itself,
// nothing here ever blocks.

#include <stdint.h>

class PeriodicTask {
public:
    PeriodicTask(uint64_t interval_us = 0)
        : interval_(interval_us), running_(false), due_(0) {}

    void interval(uint64_t us) { interval_ = us; }
    uint64_t interval() const { return interval_; }
    void start(uint64_t now_us) { running_ = true; due_ = now_us + interval_; }
    void stop() { running_ = false; }
    bool running() const { return running_; }
    uint64_t due() const { return due_; }
    bool isDue(uint64_t now_us) const { return running_ && now_us >= due_; }
    // Next period counts from the end of the current run.
    void rearm(uint64_t now_us) { due_ = now_us + interval_; }
    void deferUntil(uint64_t at_us) { due_ = at_us; }

private:
    uint64_t interval_;
    bool running_;
    uint64_t due_;
};
