#include "../include/view.hpp"
#include <cmath>
#include <cstdio>

std::string formatValue(float value, const std::string& unit) {
    char buf[32];
    if (value < 10.0f) {
        snprintf(buf, sizeof(buf), "%4.2f%s", std::round(value * 100.0f) / 100.0f, unit.c_str());
    } else if (value < 100.0f) {
        snprintf(buf, sizeof(buf), "%4.1f%s", std::round(value * 10.0f) / 10.0f, unit.c_str());
    } else {
        snprintf(buf, sizeof(buf), "%3.0f%s", std::round(value), unit.c_str());
    }
    return std::string(buf);
}
