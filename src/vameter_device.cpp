#include <Arduino.h>
#include <Wire.h>
#include "../include/vameter_device.hpp"
#include "../include/arduino_clock.hpp"
#include "../include/fake_source.hpp"
#include "../include/ina260_source.hpp"
#include "../include/logger.hpp"
#include "../include/mpr121_keypad.hpp"
#include "../include/serial_log_sink.hpp"
#include "../include/settings_store.hpp"
#include "../include/ssd1306_display.hpp"
#include "../include/udp_log_sink.hpp"

VaMeterDevice::VaMeterDevice() {}

VaMeterDevice::~VaMeterDevice() {
    delete app_;
    delete context_;
    delete log_writer_;
    delete sink_;
    delete keypad_;
    delete display_;
    delete source_;
    delete store_;
    delete config_;
    delete clock_;
}

void VaMeterDevice::onConfigSaved() {
    Logger::info("[VaMeter] Configuration changed, saving...");
    if (store_ && !store_->save()) {
        Logger::warn("[VaMeter] Settings not persisted, they are lost on reset");
    }
}

void VaMeterDevice::setupSource() {
    HardwareConfig hw = config_->getHardwareConfig();
    if (hw.source == "fake") {
        source_ = new FakeSource(clock_, config_);
        Logger::info("FakeSource initialized");
        return;
    }
    Ina260Source* ina = new Ina260Source(clock_, config_);
    if (!ina->begin()) {
        // Every session will fail the probe until the chip answers
        Logger::error("INA260 not available");
    }
    source_ = ina;
    Logger::info("Ina260Source initialized");
}

void VaMeterDevice::setupSink() {
    HardwareConfig hw = config_->getHardwareConfig();
    if (hw.log_transport == "udp") {
        UdpLogSink* udp = new UdpLogSink(config_->getNetworkConfig());
        if (udp->begin()) {
            sink_ = udp;
            Logger::info("UdpLogSink initialized");
            return;
        }
        Logger::warn("UDP logging unavailable, falling back to serial");
        delete udp;
    }
    sink_ = new SerialLogSink();
    Logger::info("SerialLogSink initialized");
}

void VaMeterDevice::setup() {
    if (!clock_) {
        clock_ = new ArduinoClock();
    }
    if (!config_) {
        config_ = new ConfigManager();
    }
    Logger::begin(config_->getLoggingConfig(), clock_);
    Logger::info("VA-Meter initializing...");

    if (!store_) {
        store_ = new SettingsStore(config_);
        store_->load();
        // Level may have changed with the stored settings
        Logger::begin(config_->getLoggingConfig(), clock_);
    }

    HardwareConfig hw = config_->getHardwareConfig();
    Wire.begin(hw.pin_sda, hw.pin_scl);

    if (!source_) setupSource();

    if (!display_) {
        display_ = new Ssd1306Display(config_->getDisplayConfig());
        if (!display_->begin()) {
            delete display_;
            display_ = nullptr;
            Logger::warn("Running without display");
        }
    }
    if (!keypad_) {
        keypad_ = new Mpr121Keypad(clock_, config_->getDisplayConfig().orientation);
        if (!keypad_->begin()) {
            delete keypad_;
            keypad_ = nullptr;
            Logger::warn("Running without keypad, sessions start automatically");
        }
    }

    if (!sink_) setupSink();
    if (!log_writer_) {
        log_writer_ = new LogWriter(sink_);
    }

    if (!context_) {
        context_ = new AppContext(clock_, config_, source_, log_writer_, display_, keypad_);
    }
    if (!app_) {
        app_ = new VaMeterApp(context_);
        app_->onConfigSaved([this]() { onConfigSaved(); });
    }
    Logger::info("VA-Meter initialized successfully");
}

void VaMeterDevice::loop() {
    if (!app_) return;
    if (app_->step() == AppState::EXIT) {
        // EXIT only comes with exit_after_session set
        Logger::info("[VaMeter] Exit requested, restarting");
        Logger::flush();
        ESP.restart();
    }
}
