#include "../include/udp_log_sink.hpp"
#include "../include/logger.hpp"
#include "../include/wifi_connector.hpp"
#include <WiFi.h>
#include <WiFiUdp.h>

UdpLogSink::UdpLogSink(const NetworkConfig& cfg)
    : cfg_(cfg), wifi_(new WiFiConnector(cfg)), udp_(new WiFiUDP()) {}

UdpLogSink::~UdpLogSink() {
    delete udp_;
    delete wifi_;
}

bool UdpLogSink::begin() {
    if (!wifi_->begin()) return false;
    Logger::info("[UdpLog] Sending data to %s:%u", cfg_.remote_ip.c_str(), (unsigned)cfg_.remote_port);
    return true;
}

bool UdpLogSink::open() {
    wifi_->loop();
    return wifi_->isConnected();
}

bool UdpLogSink::write(const std::string& line) {
    if (!wifi_->isConnected()) return false;
    if (!udp_->beginPacket(cfg_.remote_ip.c_str(), cfg_.remote_port)) return false;
    udp_->write((const uint8_t*)line.data(), line.size());
    return udp_->endPacket() == 1;
}
