#include "../include/wifi_connector.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <WiFi.h>

const uint32_t WiFiConnector::ATTEMPT_TIMEOUT_MS;

WiFiConnector::WiFiConnector(const NetworkConfig& cfg)
    : ssid_(cfg.ssid), password_(cfg.password), retry_(cfg.retry ? cfg.retry : 1) {}

WiFiConnector::~WiFiConnector() {}

bool WiFiConnector::begin() {
    if (ssid_.empty()) {
        Logger::error("WiFiConnector: No SSID configured");
        return false;
    }
    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);

    for (uint8_t attempt = 1; attempt <= retry_; attempt++) {
        Logger::info("WiFiConnector: Connecting to SSID: %s (attempt %u/%u)",
                     ssid_.c_str(), (unsigned)attempt, (unsigned)retry_);
        WiFi.begin(ssid_.c_str(), password_.c_str());
        lastAttemptMs_ = millis();
        while (WiFi.status() != WL_CONNECTED && millis() - lastAttemptMs_ < ATTEMPT_TIMEOUT_MS) {
            delay(500);
        }
        if (isConnected()) {
            Logger::info("WiFiConnector: Connected, IP %s", WiFi.localIP().toString().c_str());
            return true;
        }
        WiFi.disconnect();
    }
    Logger::error("WiFiConnector: Failed to connect to %s", ssid_.c_str());
    return false;
}

void WiFiConnector::loop() {
    if (ssid_.empty()) return;
    if (WiFi.status() == WL_CONNECTED) return;
    unsigned long now = millis();
    if (now - lastAttemptMs_ >= reconnectIntervalMs_) {
        Logger::info("WiFiConnector: Attempting reconnect to %s", ssid_.c_str());
        WiFi.disconnect();
        WiFi.begin(ssid_.c_str(), password_.c_str());
        lastAttemptMs_ = now;
    }
}

bool WiFiConnector::isConnected() const {
    return WiFi.status() == WL_CONNECTED;
}
