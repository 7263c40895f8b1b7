#pragma once
#include <stdint.h>
#include <map>
#include <vector>
#include <string>

struct LoggingConfig {
    std::string log_level;
    bool flush_on_write;
};

struct AcquisitionSettings {
    std::string int_scale;      // interval unit, one of Scales
    uint32_t interval;          // in int_scale
    uint32_t duration;          // in Scales::durationUnit(int_scale), 0 = unbounded
    uint32_t oversample;        // 0/1 = single read
    uint32_t update;            // display refresh in ms, 0 = no refresh
    bool plots;
    bool exit_after_session;    // host only, see ReadyState
    std::map<std::string, int32_t> source_params;
};

struct SourceConfig {
    float v_min;                // V
    float a_min;                // mA
    uint32_t no_load_timeout_ms;
    bool with_power;
};

enum class KeypadOrientation {
    PORTRAIT,
    LANDSCAPE
};

struct DisplayConfig {
    uint8_t width;
    uint8_t height;
    uint8_t i2c_address;
    uint8_t border;
    KeypadOrientation orientation;
};

struct NetworkConfig {
    std::string ssid;
    std::string password;
    std::string remote_ip;
    uint16_t remote_port;
    uint8_t retry;
};

struct HardwareConfig {
    std::string source;         // "ina260" or "fake"
    std::string log_transport;  // "serial" or "udp"
    int pin_sda;
    int pin_scl;
};

struct ConfigValidationRules {
    uint32_t min_interval;
    uint32_t max_interval;
    uint32_t max_duration;
    uint32_t max_update_ms;
    uint32_t max_oversample;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    const AcquisitionSettings& getAcquisitionSettings() const;
    LoggingConfig getLoggingConfig() const;
    SourceConfig getSourceConfig() const;
    DisplayConfig getDisplayConfig() const;
    NetworkConfig getNetworkConfig() const;
    HardwareConfig getHardwareConfig() const;

    void setLoggingConfig(const LoggingConfig& cfg);
    void setSourceConfig(const SourceConfig& cfg);
    void setDisplayConfig(const DisplayConfig& cfg);
    void setNetworkConfig(const NetworkConfig& cfg);
    void setHardwareConfig(const HardwareConfig& cfg);
    void setExitAfterSession(bool exit);
    void setPlots(bool plots);

    bool validateUnit(const std::string& unit, std::string& reason) const;
    bool validateSettings(const AcquisitionSettings& settings, std::string& reason) const;

    // Replaces all acquisition settings, or nothing if validation fails.
    bool applySettings(const AcquisitionSettings& settings, std::string& reason);

    // Edit-time access by key: int_scale, interval, duration, update,
    // oversample or a source parameter key. setValue commits only a valid value.
    bool hasKey(const std::string& key) const;
    std::string getValue(const std::string& key) const;
    bool setValue(const std::string& key, const std::string& text, std::string& reason);
    void registerSourceParam(const std::string& key, int32_t default_value);

private:
    AcquisitionSettings settings_;
    LoggingConfig logging_config_;
    SourceConfig source_config_;
    DisplayConfig display_config_;
    NetworkConfig network_config_;
    HardwareConfig hardware_config_;
    ConfigValidationRules validation_rules_;

    void initializeDefaults();
    bool parseUnsigned(const std::string& text, uint32_t& out, std::string& reason) const;
    bool checkRange(const char* name, uint32_t value, uint32_t min, uint32_t max, std::string& reason) const;
};
