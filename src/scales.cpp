#include "../include/scales.hpp"
#include "../include/exceptions.hpp"

namespace {

struct ScaleEntry {
    const char* unit;
    double factor;
    const char* duration_unit;
};

const ScaleEntry SCALES[] = {
    {"ms", 0.001,   "s"},
    {"s",  1.0,     "m"},
    {"m",  60.0,    "h"},
    {"h",  3600.0,  "d"},
    {"d",  86400.0, "d"},
};

const size_t SCALE_COUNT = sizeof(SCALES) / sizeof(SCALES[0]);

const ScaleEntry& lookup(const std::string& unit) {
    for (size_t i = 0; i < SCALE_COUNT; ++i) {
        if (unit == SCALES[i].unit) return SCALES[i];
    }
    throw ConfigException("Invalid interval unit: '" + unit + "'", ERR_INVALID_UNIT);
}

}

bool Scales::isValidUnit(const std::string& unit) {
    for (size_t i = 0; i < SCALE_COUNT; ++i) {
        if (unit == SCALES[i].unit) return true;
    }
    return false;
}

double Scales::intervalFactor(const std::string& unit) {
    return lookup(unit).factor;
}

const char* Scales::durationUnit(const std::string& unit) {
    return lookup(unit).duration_unit;
}

double Scales::durationFactor(const std::string& unit) {
    return lookup(lookup(unit).duration_unit).factor;
}

size_t Scales::unitCount() {
    return SCALE_COUNT;
}

const char* Scales::unitAt(size_t index) {
    if (index >= SCALE_COUNT) {
        throw ConfigException("Interval unit index out of range: " + std::to_string(index), ERR_INVALID_UNIT);
    }
    return SCALES[index].unit;
}
