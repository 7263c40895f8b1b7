#pragma once
#include "app_context.hpp"
#include "app_states.hpp"
#include "config_manager.hpp"
#include "log_writer.hpp"
#include "sample_source.hpp"
#include <stdint.h>

class ArduinoClock;
class SettingsStore;
class Ssd1306Display;
class Mpr121Keypad;

class VaMeterDevice {
public:
    VaMeterDevice();
    ~VaMeterDevice();

    void setup();
    void loop();

    // Callback for a finished config session
    void onConfigSaved();

private:
    ArduinoClock* clock_ = nullptr;
    ConfigManager* config_ = nullptr;
    SettingsStore* store_ = nullptr;
    SampleSource* source_ = nullptr;
    Ssd1306Display* display_ = nullptr;
    Mpr121Keypad* keypad_ = nullptr;
    LogSink* sink_ = nullptr;
    LogWriter* log_writer_ = nullptr;
    AppContext* context_ = nullptr;
    VaMeterApp* app_ = nullptr;

    void setupSource();
    void setupSink();
};
