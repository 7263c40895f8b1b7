#pragma once
#include <string>

class ConfigManager;

/**
 * @brief JSON persistence of the configuration on LittleFS.
 *
 * settings.json holds the acquisition settings plus the hardware, source,
 * display and logging sections; secrets.json holds the WiFi credentials and
 * is only ever read. A missing or invalid file leaves the defaults in place.
 */
class SettingsStore {
public:
    static const char* const SETTINGS_PATH;
    static const char* const SECRETS_PATH;

    explicit SettingsStore(ConfigManager* config);

    // LittleFS must be mounted
    bool load();
    bool save();

private:
    ConfigManager* config_;

    bool loadSecrets();
};
