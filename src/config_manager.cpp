#include "../include/config_manager.hpp"
#include "../include/scales.hpp"
#include "../include/logger.hpp"
#include <cstdlib>

ConfigManager::ConfigManager() {
    initializeDefaults();
}

void ConfigManager::initializeDefaults() {
    settings_.int_scale = "ms";
    settings_.interval = 1000;
    settings_.duration = 0;
    settings_.oversample = 0;
    settings_.update = 1000;
    settings_.plots = false;
    settings_.exit_after_session = false;
    settings_.source_params.clear();

    logging_config_.log_level = "INFO";
    logging_config_.flush_on_write = true;

    source_config_.v_min = 0.5f;
    source_config_.a_min = 1.0f;
    source_config_.no_load_timeout_ms = 60000;
    source_config_.with_power = false;

    display_config_.width = 128;
    display_config_.height = 64;
    display_config_.i2c_address = 0x3C;
    display_config_.border = 1;
    display_config_.orientation = KeypadOrientation::PORTRAIT;

    network_config_.ssid = "";
    network_config_.password = "";
    network_config_.remote_ip = "192.168.1.100";
    network_config_.remote_port = 6500;
    network_config_.retry = 3;

    hardware_config_.source = "ina260";
    hardware_config_.log_transport = "serial";
    hardware_config_.pin_sda = 21;
    hardware_config_.pin_scl = 22;

    validation_rules_.min_interval = 1;
    validation_rules_.max_interval = 100000;
    validation_rules_.max_duration = 100000;
    validation_rules_.max_update_ms = 60000;
    validation_rules_.max_oversample = 1000;
}

ConfigManager::~ConfigManager() {}

const AcquisitionSettings& ConfigManager::getAcquisitionSettings() const { return settings_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
SourceConfig ConfigManager::getSourceConfig() const { return source_config_; }
DisplayConfig ConfigManager::getDisplayConfig() const { return display_config_; }
NetworkConfig ConfigManager::getNetworkConfig() const { return network_config_; }
HardwareConfig ConfigManager::getHardwareConfig() const { return hardware_config_; }

void ConfigManager::setLoggingConfig(const LoggingConfig& cfg) { logging_config_ = cfg; }
void ConfigManager::setSourceConfig(const SourceConfig& cfg) { source_config_ = cfg; }
void ConfigManager::setDisplayConfig(const DisplayConfig& cfg) { display_config_ = cfg; }
void ConfigManager::setNetworkConfig(const NetworkConfig& cfg) { network_config_ = cfg; }
void ConfigManager::setHardwareConfig(const HardwareConfig& cfg) { hardware_config_ = cfg; }
void ConfigManager::setExitAfterSession(bool exit) { settings_.exit_after_session = exit; }
void ConfigManager::setPlots(bool plots) { settings_.plots = plots; }

bool ConfigManager::validateUnit(const std::string& unit, std::string& reason) const {
    if (!Scales::isValidUnit(unit)) {
        reason = "Invalid interval unit: '" + unit + "' (valid: ms, s, m, h, d)";
        return false;
    }
    return true;
}

bool ConfigManager::checkRange(const char* name, uint32_t value, uint32_t min, uint32_t max, std::string& reason) const {
    if (value < min || value > max) {
        reason = std::string(name) + " out of range: " + std::to_string(value) +
                 " (valid range: " + std::to_string(min) + "-" + std::to_string(max) + ")";
        return false;
    }
    return true;
}

bool ConfigManager::validateSettings(const AcquisitionSettings& settings, std::string& reason) const {
    if (!validateUnit(settings.int_scale, reason)) return false;
    if (!checkRange("Interval", settings.interval, validation_rules_.min_interval,
                    validation_rules_.max_interval, reason)) return false;
    if (!checkRange("Duration", settings.duration, 0, validation_rules_.max_duration, reason)) return false;
    if (!checkRange("Update", settings.update, 0, validation_rules_.max_update_ms, reason)) return false;
    if (!checkRange("Oversample", settings.oversample, 0, validation_rules_.max_oversample, reason)) return false;
    for (std::map<std::string, int32_t>::const_iterator it = settings.source_params.begin();
         it != settings.source_params.end(); ++it) {
        if (it->second < 0) {
            reason = "Source parameter " + it->first + " must not be negative";
            return false;
        }
    }
    return true;
}

bool ConfigManager::applySettings(const AcquisitionSettings& settings, std::string& reason) {
    if (!validateSettings(settings, reason)) {
        Logger::warn("[ConfigMgr] Settings rejected: %s", reason.c_str());
        return false;
    }
    settings_ = settings;
    Logger::info("[ConfigMgr] Settings applied: interval=%u%s duration=%u update=%ums oversample=%u",
                 (unsigned)settings_.interval, settings_.int_scale.c_str(), (unsigned)settings_.duration,
                 (unsigned)settings_.update, (unsigned)settings_.oversample);
    return true;
}

void ConfigManager::registerSourceParam(const std::string& key, int32_t default_value) {
    if (settings_.source_params.find(key) == settings_.source_params.end()) {
        settings_.source_params[key] = default_value;
    }
}

bool ConfigManager::hasKey(const std::string& key) const {
    return key == "int_scale" || key == "interval" || key == "duration" ||
           key == "update" || key == "oversample" ||
           settings_.source_params.find(key) != settings_.source_params.end();
}

std::string ConfigManager::getValue(const std::string& key) const {
    if (key == "int_scale") return settings_.int_scale;
    if (key == "interval") return std::to_string(settings_.interval);
    if (key == "duration") return std::to_string(settings_.duration);
    if (key == "update") return std::to_string(settings_.update);
    if (key == "oversample") return std::to_string(settings_.oversample);
    std::map<std::string, int32_t>::const_iterator it = settings_.source_params.find(key);
    if (it != settings_.source_params.end()) return std::to_string(it->second);
    return "";
}

bool ConfigManager::parseUnsigned(const std::string& text, uint32_t& out, std::string& reason) const {
    if (text.empty() || text.size() > 10) {
        reason = "Not a number: '" + text + "'";
        return false;
    }
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] < '0' || text[i] > '9') {
            reason = "Not a number: '" + text + "'";
            return false;
        }
    }
    unsigned long long value = strtoull(text.c_str(), nullptr, 10);
    if (value > 0xFFFFFFFFULL) {
        reason = "Number too large: " + text;
        return false;
    }
    out = (uint32_t)value;
    return true;
}

bool ConfigManager::setValue(const std::string& key, const std::string& text, std::string& reason) {
    if (!hasKey(key)) {
        reason = "Unknown setting: " + key;
        return false;
    }

    AcquisitionSettings updated = settings_;
    if (key == "int_scale") {
        updated.int_scale = text;
    } else {
        uint32_t value = 0;
        if (!parseUnsigned(text, value, reason)) return false;
        if (key == "interval") updated.interval = value;
        else if (key == "duration") updated.duration = value;
        else if (key == "update") updated.update = value;
        else if (key == "oversample") updated.oversample = value;
        else if (value > 0x7FFFFFFFUL) {
            reason = "Number too large: " + text;
            return false;
        } else {
            updated.source_params[key] = (int32_t)value;
        }
    }

    if (!validateSettings(updated, reason)) {
        Logger::warn("[ConfigMgr] %s rejected: %s", key.c_str(), reason.c_str());
        return false;
    }
    settings_ = updated;
    Logger::debug("[ConfigMgr] %s = %s", key.c_str(), text.c_str());
    return true;
}
