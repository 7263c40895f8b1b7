#pragma once
#include <cstddef>
#include <string>

// Interval units and the larger unit their durations are counted in:
//   ms -> s, s -> m, m -> h, h -> d, d -> d
// Lookups of an unknown unit throw ConfigException(ERR_INVALID_UNIT); units
// must be validated when they are edited, never during a session.
class Scales {
public:
    static bool isValidUnit(const std::string& unit);
    // seconds per unit
    static double intervalFactor(const std::string& unit);
    static const char* durationUnit(const std::string& unit);
    // seconds per duration unit, i.e. intervalFactor(durationUnit(unit))
    static double durationFactor(const std::string& unit);
    static size_t unitCount();
    static const char* unitAt(size_t index);
};
