#pragma once
#include <stdint.h>
#include "sample_source.hpp"

class Adafruit_INA260;
class Clock;
class ConfigManager;

/**
 * @brief Voltage, current and optionally power of a load measured by an INA260.
 *
 * A read blocks until the load draws at least SourceConfig::v_min and
 * SourceConfig::a_min. Once the load has been seen, a reading below the
 * thresholds ends the stream; if the load never shows up within
 * SourceConfig::no_load_timeout_ms the stream ends as well.
 */
class Ina260Source : public SampleSource {
public:
    static const int32_t DEFAULT_COUNT = 16;
    static const int32_t DEFAULT_CTIME = 1;
    static const uint64_t POLL_US = 1000;

    Ina260Source(Clock* clock, ConfigManager* config);
    ~Ina260Source();

    // false if the chip does not answer on the bus
    bool begin();

    void reset() override;
    ReadResult read(std::vector<float>& values) override;
    size_t channelCount() const override;
    std::vector<std::string> channelUnits() const override;
    std::vector<int> channelDecimals() const override;
    std::vector<ConfigItem> configItems() const override;

    // Averaging counts accepted by the chip, index = register value.
    static int averagingIndex(int32_t count);

private:
    Clock* clock_;
    ConfigManager* config_;
    Adafruit_INA260* ina_;
    bool present_;
    bool started_;

    void applySettings();
};
