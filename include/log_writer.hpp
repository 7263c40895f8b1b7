#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "types.hpp"

// Transport for data-log lines. Best effort: write() reports failure, it never throws.
class LogSink {
public:
    virtual ~LogSink() {}
    virtual bool open() { return true; }
    virtual bool write(const std::string& line) = 0;
    virtual void close() {}
};

/**
 * @brief Formats a session as comment-prefixed header, one CSV line per
 * sample and a comment-prefixed summary, and hands each line to a LogSink.
 *
 * Sink failures are counted and dropped so the acquisition timing is never
 * affected by the transport.
 */
class LogWriter {
public:
    explicit LogWriter(LogSink* sink = nullptr);

    void setSink(LogSink* sink) { sink_ = sink; }
    LogSink* sink() const { return sink_; }

    void open();
    void writeSettingsHeader(const AcquisitionSettings& settings);
    /**
     * @param decimals per channel precision, from SampleSource::channelDecimals()
     * @param units per channel unit, used by the summary
     */
    void setChannelFormat(const std::vector<int>& decimals, const std::vector<std::string>& units);
    void writeSample(double elapsed_s, const std::vector<float>& values);
    void writeSummary(uint32_t sample_count, double elapsed_s, const ResultSet& results);
    void close();

    uint32_t droppedLines() const { return dropped_; }

    std::string formatSample(double elapsed_s, const std::vector<float>& values) const;

private:
    LogSink* sink_;
    bool open_;
    uint32_t dropped_;
    std::string int_scale_;
    std::string dur_scale_;
    double int_fac_;
    double dur_fac_;
    std::vector<int> decimals_;
    std::vector<std::string> units_;

    void emit(const std::string& line);
};
