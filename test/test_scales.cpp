/**
 * Interval unit table: factors, duration units and unknown units.
 */

#include "test_support.hpp"
#include "../include/scales.hpp"

bool test_interval_factors() {
    printTestHeader("TEST 1: Interval factors");
    CHECK(near(Scales::intervalFactor("ms"), 0.001, 1e-12));
    CHECK(near(Scales::intervalFactor("s"), 1.0, 1e-12));
    CHECK(near(Scales::intervalFactor("m"), 60.0, 1e-12));
    CHECK(near(Scales::intervalFactor("h"), 3600.0, 1e-12));
    CHECK(near(Scales::intervalFactor("d"), 86400.0, 1e-12));
    return true;
}

bool test_duration_units() {
    printTestHeader("TEST 2: Duration units and factors");
    CHECK(std::string(Scales::durationUnit("ms")) == "s");
    CHECK(std::string(Scales::durationUnit("s")) == "m");
    CHECK(std::string(Scales::durationUnit("m")) == "h");
    CHECK(std::string(Scales::durationUnit("h")) == "d");
    CHECK(std::string(Scales::durationUnit("d")) == "d");
    CHECK(near(Scales::durationFactor("ms"), 1.0, 1e-12));
    CHECK(near(Scales::durationFactor("s"), 60.0, 1e-12));
    CHECK(near(Scales::durationFactor("m"), 3600.0, 1e-12));
    CHECK(near(Scales::durationFactor("h"), 86400.0, 1e-12));
    CHECK(near(Scales::durationFactor("d"), 86400.0, 1e-12));
    return true;
}

bool test_unit_order() {
    printTestHeader("TEST 3: Unit order");
    CHECK(Scales::unitCount() == 5);
    const char* expected[] = {"ms", "s", "m", "h", "d"};
    for (size_t i = 0; i < 5; i++) {
        CHECK(std::string(Scales::unitAt(i)) == expected[i]);
        CHECK(Scales::isValidUnit(expected[i]));
    }
    return true;
}

bool test_unknown_unit() {
    printTestHeader("TEST 4: Unknown units are rejected");
    CHECK(!Scales::isValidUnit("us"));
    CHECK(!Scales::isValidUnit(""));
    CHECK(!Scales::isValidUnit("MS"));

    bool thrown = false;
    try {
        Scales::intervalFactor("w");
    } catch (const ConfigException& e) {
        thrown = e.code() == ERR_INVALID_UNIT;
    }
    CHECK(thrown);

    thrown = false;
    try {
        Scales::unitAt(5);
    } catch (const ConfigException&) {
        thrown = true;
    }
    CHECK(thrown);
    return true;
}

int main() {
    printTestResult("Interval factors", test_interval_factors());
    printTestResult("Duration units", test_duration_units());
    printTestResult("Unit order", test_unit_order());
    printTestResult("Unknown unit", test_unknown_unit());
    return printSummary();
}
