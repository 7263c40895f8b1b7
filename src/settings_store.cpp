#include "../include/settings_store.hpp"
#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include <ArduinoJson.h>

const char* const SettingsStore::SETTINGS_PATH = "/config/settings.json";
const char* const SettingsStore::SECRETS_PATH = "/config/secrets.json";

SettingsStore::SettingsStore(ConfigManager* config) : config_(config) {}

bool SettingsStore::load() {
    loadSecrets();

    if (!LittleFS.exists(SETTINGS_PATH)) {
        Logger::info("[Settings] %s not found, using defaults", SETTINGS_PATH);
        return false;
    }
    File file = LittleFS.open(SETTINGS_PATH, "r");
    if (!file) {
        Logger::error("[Settings] Failed to open %s", SETTINGS_PATH);
        return false;
    }
    DynamicJsonDocument doc(2048);
    DeserializationError error = deserializeJson(doc, file);
    file.close();
    if (error) {
        Logger::error("[Settings] Failed to parse %s: %s", SETTINGS_PATH, error.c_str());
        return false;
    }

    // Sections are optional, absent keys keep their current value
    LoggingConfig logging = config_->getLoggingConfig();
    JsonObject log_obj = doc["logging"];
    if (!log_obj.isNull()) {
        logging.log_level = log_obj["log_level"] | logging.log_level.c_str();
        logging.flush_on_write = log_obj["flush_on_write"] | logging.flush_on_write;
        config_->setLoggingConfig(logging);
    }

    SourceConfig source = config_->getSourceConfig();
    JsonObject src_obj = doc["source"];
    if (!src_obj.isNull()) {
        source.v_min = src_obj["v_min"] | source.v_min;
        source.a_min = src_obj["a_min"] | source.a_min;
        source.no_load_timeout_ms = src_obj["no_load_timeout_ms"] | source.no_load_timeout_ms;
        source.with_power = src_obj["with_power"] | source.with_power;
        config_->setSourceConfig(source);
    }

    DisplayConfig display = config_->getDisplayConfig();
    JsonObject disp_obj = doc["display"];
    if (!disp_obj.isNull()) {
        display.width = disp_obj["width"] | display.width;
        display.height = disp_obj["height"] | display.height;
        display.i2c_address = disp_obj["i2c_address"] | display.i2c_address;
        display.border = disp_obj["border"] | display.border;
        const char* orient = disp_obj["keypad"] | "P";
        display.orientation = (orient[0] == 'L') ? KeypadOrientation::LANDSCAPE : KeypadOrientation::PORTRAIT;
        config_->setDisplayConfig(display);
    }

    HardwareConfig hardware = config_->getHardwareConfig();
    JsonObject hw_obj = doc["hardware"];
    if (!hw_obj.isNull()) {
        hardware.source = hw_obj["source"] | hardware.source.c_str();
        hardware.log_transport = hw_obj["log_transport"] | hardware.log_transport.c_str();
        hardware.pin_sda = hw_obj["pin_sda"] | hardware.pin_sda;
        hardware.pin_scl = hw_obj["pin_scl"] | hardware.pin_scl;
        config_->setHardwareConfig(hardware);
    }

    JsonObject acq_obj = doc["acquisition"];
    if (acq_obj.isNull()) {
        return true;
    }
    AcquisitionSettings settings = config_->getAcquisitionSettings();
    settings.int_scale = acq_obj["int_scale"] | settings.int_scale.c_str();
    settings.interval = acq_obj["interval"] | settings.interval;
    settings.duration = acq_obj["duration"] | settings.duration;
    settings.oversample = acq_obj["oversample"] | settings.oversample;
    settings.update = acq_obj["update"] | settings.update;
    settings.plots = acq_obj["plots"] | settings.plots;
    JsonObject params = acq_obj["source_params"];
    for (JsonPair kv : params) {
        settings.source_params[kv.key().c_str()] = kv.value().as<int32_t>();
    }

    std::string reason;
    if (!config_->applySettings(settings, reason)) {
        Logger::error("[Settings] Stored acquisition settings rejected: %s", reason.c_str());
        return false;
    }
    Logger::info("[Settings] Loaded %s", SETTINGS_PATH);
    return true;
}

bool SettingsStore::loadSecrets() {
    if (!LittleFS.exists(SECRETS_PATH)) {
        return false;
    }
    File file = LittleFS.open(SECRETS_PATH, "r");
    if (!file) return false;
    DynamicJsonDocument doc(512);
    DeserializationError error = deserializeJson(doc, file);
    file.close();
    if (error) {
        Logger::error("[Settings] Failed to parse %s: %s", SECRETS_PATH, error.c_str());
        return false;
    }

    NetworkConfig net = config_->getNetworkConfig();
    net.ssid = doc["ssid"] | net.ssid.c_str();
    net.password = doc["password"] | net.password.c_str();
    net.remote_ip = doc["remote_ip"] | net.remote_ip.c_str();
    net.remote_port = doc["remote_port"] | net.remote_port;
    net.retry = doc["retry"] | net.retry;
    config_->setNetworkConfig(net);
    return true;
}

bool SettingsStore::save() {
    DynamicJsonDocument doc(2048);

    const AcquisitionSettings& settings = config_->getAcquisitionSettings();
    JsonObject acq = doc.createNestedObject("acquisition");
    acq["int_scale"] = settings.int_scale.c_str();
    acq["interval"] = settings.interval;
    acq["duration"] = settings.duration;
    acq["oversample"] = settings.oversample;
    acq["update"] = settings.update;
    acq["plots"] = settings.plots;
    JsonObject params = acq.createNestedObject("source_params");
    for (std::map<std::string, int32_t>::const_iterator it = settings.source_params.begin();
         it != settings.source_params.end(); ++it) {
        params[it->first.c_str()] = it->second;
    }

    LoggingConfig logging = config_->getLoggingConfig();
    JsonObject log_obj = doc.createNestedObject("logging");
    log_obj["log_level"] = logging.log_level.c_str();
    log_obj["flush_on_write"] = logging.flush_on_write;

    SourceConfig source = config_->getSourceConfig();
    JsonObject src_obj = doc.createNestedObject("source");
    src_obj["v_min"] = source.v_min;
    src_obj["a_min"] = source.a_min;
    src_obj["no_load_timeout_ms"] = source.no_load_timeout_ms;
    src_obj["with_power"] = source.with_power;

    DisplayConfig display = config_->getDisplayConfig();
    JsonObject disp_obj = doc.createNestedObject("display");
    disp_obj["width"] = display.width;
    disp_obj["height"] = display.height;
    disp_obj["i2c_address"] = display.i2c_address;
    disp_obj["border"] = display.border;
    disp_obj["keypad"] = display.orientation == KeypadOrientation::LANDSCAPE ? "L" : "P";

    HardwareConfig hardware = config_->getHardwareConfig();
    JsonObject hw_obj = doc.createNestedObject("hardware");
    hw_obj["source"] = hardware.source.c_str();
    hw_obj["log_transport"] = hardware.log_transport.c_str();
    hw_obj["pin_sda"] = hardware.pin_sda;
    hw_obj["pin_scl"] = hardware.pin_scl;

    if (!LittleFS.exists("/config")) LittleFS.mkdir("/config");
    File file = LittleFS.open(SETTINGS_PATH, "w");
    if (!file) {
        Logger::error("[Settings] Failed to open %s for writing", SETTINGS_PATH);
        return false;
    }
    size_t written = serializeJsonPretty(doc, file);
    file.close();
    if (written == 0) {
        Logger::error("[Settings] Failed to write %s", SETTINGS_PATH);
        return false;
    }
    Logger::info("[Settings] Saved %u bytes to %s", (unsigned)written, SETTINGS_PATH);
    return true;
}
