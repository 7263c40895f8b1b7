#pragma once
#include <string>
#include <vector>

enum class ReadResult {
    OK,
    END_OF_STREAM,  // no more data, e.g. the load was removed
    FAILURE
};

// Source-specific setting shown by the config editor, stored in
// AcquisitionSettings::source_params under key.
struct ConfigItem {
    std::string heading;
    std::string key;
    std::string unit;
};

class SampleSource {
public:
    virtual ~SampleSource() {}

    // Called once before every session, applies the current settings.
    virtual void reset() = 0;
    // Fills exactly channelCount() values on OK.
    virtual ReadResult read(std::vector<float>& values) = 0;
    virtual size_t channelCount() const = 0;
    virtual std::vector<std::string> channelUnits() const = 0;
    // Decimals per channel in the data log.
    virtual std::vector<int> channelDecimals() const = 0;
    virtual std::vector<ConfigItem> configItems() const { return std::vector<ConfigItem>(); }
};
