#pragma once
#include <string>
#include <cstdint>
#include "config_manager.hpp"

class WiFiConnector {
public:
    static const uint32_t ATTEMPT_TIMEOUT_MS = 10000;

    explicit WiFiConnector(const NetworkConfig& cfg);
    ~WiFiConnector();

    // Blocking connect, gives up after NetworkConfig::retry attempts
    bool begin();
    // Non-blocking; will attempt reconnects periodically
    void loop();
    bool isConnected() const;

private:
    std::string ssid_;
    std::string password_;
    uint8_t retry_;
    uint32_t lastAttemptMs_ = 0;
    uint32_t reconnectIntervalMs_ = 10000; // try every 10s
};
