#include "../include/ina260_source.hpp"
#include "../include/clock.hpp"
#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <Adafruit_INA260.h>
#include <string>

const int32_t Ina260Source::DEFAULT_COUNT;
const int32_t Ina260Source::DEFAULT_CTIME;
const uint64_t Ina260Source::POLL_US;

namespace {
const int32_t AVERAGING_COUNTS[] = {1, 4, 16, 64, 128, 256, 512, 1024};
const size_t NUM_AVERAGING_COUNTS = sizeof(AVERAGING_COUNTS) / sizeof(AVERAGING_COUNTS[0]);
const int32_t MAX_CTIME = 7;
}

Ina260Source::Ina260Source(Clock* clock, ConfigManager* config)
    : clock_(clock), config_(config), ina_(new Adafruit_INA260()), present_(false), started_(false) {
    config_->registerSourceParam("ina260_count", DEFAULT_COUNT);
    config_->registerSourceParam("ina260_ctime", DEFAULT_CTIME);
}

Ina260Source::~Ina260Source() {
    delete ina_;
}

bool Ina260Source::begin() {
    present_ = ina_->begin();
    if (!present_) {
        Logger::error("[INA260] Chip not found on I2C bus");
    } else {
        Logger::info("[INA260] Chip found");
    }
    return present_;
}

int Ina260Source::averagingIndex(int32_t count) {
    for (size_t i = 0; i < NUM_AVERAGING_COUNTS; i++) {
        if (AVERAGING_COUNTS[i] == count) return (int)i;
    }
    return -1;
}

void Ina260Source::applySettings() {
    const AcquisitionSettings& settings = config_->getAcquisitionSettings();
    int32_t count = settings.source_params.count("ina260_count")
        ? settings.source_params.at("ina260_count") : DEFAULT_COUNT;
    int32_t ctime = settings.source_params.count("ina260_ctime")
        ? settings.source_params.at("ina260_ctime") : DEFAULT_CTIME;

    std::string reason;
    if (averagingIndex(count) < 0) {
        Logger::warn("[INA260] Invalid averaging count %d, using %d", (int)count, (int)DEFAULT_COUNT);
        count = DEFAULT_COUNT;
        if (!config_->setValue("ina260_count", std::to_string(count), reason)) {
            Logger::warn("[INA260] Could not store averaging count: %s", reason.c_str());
        }
    }
    if (ctime < 0 || ctime > MAX_CTIME) {
        Logger::warn("[INA260] Invalid conversion time %d, using %d", (int)ctime, (int)DEFAULT_CTIME);
        ctime = DEFAULT_CTIME;
        if (!config_->setValue("ina260_ctime", std::to_string(ctime), reason)) {
            Logger::warn("[INA260] Could not store conversion time: %s", reason.c_str());
        }
    }

    ina_->setAveragingCount((INA260_AveragingCount)averagingIndex(count));
    ina_->setCurrentConversionTime((INA260_ConversionTime)ctime);
    ina_->setVoltageConversionTime((INA260_ConversionTime)ctime);
    Logger::debug("[INA260] averaging=%d conversion time index=%d", (int)count, (int)ctime);
}

void Ina260Source::reset() {
    if (!present_ && !begin()) {
        throw SourceException("INA260 not responding");
    }
    started_ = false;
    applySettings();
}

ReadResult Ina260Source::read(std::vector<float>& values) {
    if (!present_) return ReadResult::FAILURE;

    const SourceConfig source = config_->getSourceConfig();
    uint64_t t_start = clock_->micros();
    uint64_t timeout_us = (uint64_t)source.no_load_timeout_ms * 1000ULL;

    while (true) {
        float v = ina_->readBusVoltage() / 1000.0f;
        float a = ina_->readCurrent();
        if (a < 0.0f) a = 0.0f;

        if (v >= source.v_min && a >= source.a_min) {
            started_ = true;
            values.clear();
            values.push_back(v);
            values.push_back(a);
            if (source.with_power) values.push_back(ina_->readPower());
            return ReadResult::OK;
        }
        if (started_) {
            Logger::info("[INA260] Load removed");
            return ReadResult::END_OF_STREAM;
        }
        if (clock_->micros() - t_start > timeout_us) {
            Logger::warn("[INA260] No load detected within %u ms", (unsigned)source.no_load_timeout_ms);
            return ReadResult::END_OF_STREAM;
        }
        clock_->sleepMicros(POLL_US);
    }
}

size_t Ina260Source::channelCount() const {
    return config_->getSourceConfig().with_power ? 3 : 2;
}

std::vector<std::string> Ina260Source::channelUnits() const {
    std::vector<std::string> units;
    units.push_back("V");
    units.push_back("mA");
    if (channelCount() == 3) units.push_back("mW");
    return units;
}

std::vector<int> Ina260Source::channelDecimals() const {
    return std::vector<int>(channelCount(), 3);
}

std::vector<ConfigItem> Ina260Source::configItems() const {
    std::vector<ConfigItem> items;
    ConfigItem count = {"AVG-Count", "ina260_count", ""};
    ConfigItem ctime = {"Conv-Time", "ina260_ctime", ""};
    items.push_back(count);
    items.push_back(ctime);
    return items;
}
