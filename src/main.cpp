#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include "../include/vameter_device.hpp"
#include "../include/logger.hpp"

VaMeterDevice device;

void setup() {
    Serial.begin(115200);
    if (!LittleFS.begin(true)) { // true = format if mount fails
        Serial.println("#LittleFS mount failed and formatted!");
    }
    if (!LittleFS.exists("/config")) LittleFS.mkdir("/config");
    device.setup();
    Logger::info("VA-Meter setup complete");
}

void loop() {
    device.loop();
}
