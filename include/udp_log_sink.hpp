#pragma once
#include <stdint.h>
#include "config_manager.hpp"
#include "log_writer.hpp"

class WiFiConnector;
class WiFiUDP;

// Sends every data-log line as one UDP datagram to NetworkConfig::remote_ip.
class UdpLogSink : public LogSink {
public:
    explicit UdpLogSink(const NetworkConfig& cfg);
    ~UdpLogSink();

    // Joins the network, false when all retries failed
    bool begin();

    bool open() override;
    bool write(const std::string& line) override;

private:
    NetworkConfig cfg_;
    WiFiConnector* wifi_;
    WiFiUDP* udp_;
};
