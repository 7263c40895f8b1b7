/**
 * Keypad editing of the acquisition settings.
 */

#include "test_support.hpp"
#include "../include/config_editor.hpp"
#include "../include/config_manager.hpp"
#include "../include/logger.hpp"

static void type(ConfigEditor& editor, const char* keys) {
    for (const char* p = keys; *p; p++) {
        if (*p >= '0' && *p <= '9') editor.handleKey(digitKey(*p - '0'));
        else if (*p == '<') editor.handleKey(Key::CLR);
        else if (*p == '.') editor.handleKey(Key::DOT);
    }
}

bool test_fields() {
    printTestHeader("TEST 1: Field list");
    ConfigManager config;
    ConfigEditor editor(&config, std::vector<ConfigItem>());
    CHECK(editor.fields().size() == 4);
    CHECK(editor.fields()[0].key == "int_scale");
    CHECK(editor.fields()[1].key == "interval");
    CHECK(editor.fields()[2].key == "duration");
    CHECK(editor.fields()[3].key == "update");
    CHECK(editor.unitFor(1) == "ms");
    CHECK(editor.unitFor(2) == "s");
    CHECK(editor.unitFor(3) == "ms");

    AcquisitionSettings s = config.getAcquisitionSettings();
    s.oversample = 4;
    std::string reason;
    CHECK(config.applySettings(s, reason));
    config.registerSourceParam("ina260_count", 16);
    std::vector<ConfigItem> items;
    ConfigItem count = {"AVG-Count", "ina260_count", ""};
    ConfigItem unknown = {"Gain", "not_registered", ""};
    items.push_back(count);
    items.push_back(unknown);
    ConfigEditor full(&config, items);
    CHECK(full.fields().size() == 6);
    CHECK(full.fields()[4].key == "oversample");
    CHECK(full.fields()[5].heading == "AVG-Count");
    return true;
}

bool test_number_editing() {
    printTestHeader("TEST 2: Digits, CLR and NEXT");
    ConfigManager config;
    ConfigEditor editor(&config, std::vector<ConfigItem>());
    editor.begin(1);
    CHECK(editor.buffer() == "1000");
    type(editor, "<5");
    CHECK(editor.buffer() == "1005");
    CHECK(config.getValue("interval") == "1000");
    CHECK(editor.handleKey(Key::NEXT));
    CHECK(config.getValue("interval") == "1005");

    editor.begin(2);
    CHECK(editor.buffer() == "0");
    type(editor, "7");
    CHECK(editor.buffer() == "7");
    type(editor, "<<<");
    CHECK(editor.buffer() == "0");
    type(editor, "30.");
    CHECK(editor.buffer() == "30");
    CHECK(editor.handleKey(Key::NEXT));
    CHECK(config.getValue("duration") == "30");
    return true;
}

bool test_rejected_value() {
    printTestHeader("TEST 3: Out of range value is not committed");
    ConfigManager config;
    ConfigEditor editor(&config, std::vector<ConfigItem>());
    editor.begin(1);
    type(editor, "<<<<");
    CHECK(editor.buffer() == "0");
    CHECK(!editor.handleKey(Key::NEXT));
    CHECK(!editor.lastError().empty());
    CHECK(editor.buffer() == "1000");
    CHECK(config.getValue("interval") == "1000");

    editor.begin(3);
    type(editor, "99999");
    CHECK(!editor.handleKey(Key::NEXT));
    CHECK(config.getValue("update") == "1000");
    CHECK(editor.buffer() == "1000");
    return true;
}

bool test_unit_selection() {
    printTestHeader("TEST 4: Interval unit by digit");
    ConfigManager config;
    ConfigEditor editor(&config, std::vector<ConfigItem>());
    editor.begin(0);
    CHECK(editor.buffer() == "ms");
    type(editor, "2");
    CHECK(editor.buffer() == "s");
    type(editor, "0");
    CHECK(editor.buffer() == "d");
    type(editor, "9");
    CHECK(editor.buffer() == "d");
    type(editor, "1");
    CHECK(editor.buffer() == "ms");
    type(editor, "4<");
    CHECK(editor.buffer() == "ms");
    type(editor, "3");
    CHECK(editor.buffer() == "m");
    CHECK(editor.handleKey(Key::NEXT));
    CHECK(config.getValue("int_scale") == "m");
    CHECK(editor.unitFor(1) == "m");
    CHECK(editor.unitFor(2) == "h");
    return true;
}

int main() {
    LoggingConfig logging;
    logging.log_level = "ERROR";
    logging.flush_on_write = true;
    Logger::begin(logging);

    printTestResult("Field list", test_fields());
    printTestResult("Number editing", test_number_editing());
    printTestResult("Rejected value", test_rejected_value());
    printTestResult("Unit selection", test_unit_selection());
    return printSummary();
}
