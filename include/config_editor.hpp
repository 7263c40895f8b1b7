#pragma once
#include <string>
#include <vector>
#include "key_input.hpp"
#include "sample_source.hpp"

class ConfigManager;

struct ConfigField {
    std::string heading;
    std::string key;
    std::string unit;
};

/**
 * @brief Keypad editing of the acquisition settings, one field at a time.
 *
 * Digits build the value in a text buffer, CLR deletes, NEXT commits the
 * buffer through ConfigManager::setValue(). Nothing is written before NEXT
 * and a rejected value leaves the stored setting untouched.
 */
class ConfigEditor {
public:
    ConfigEditor(ConfigManager* config, const std::vector<ConfigItem>& source_items);

    const std::vector<ConfigField>& fields() const { return fields_; }
    void begin(size_t index);
    size_t current() const { return index_; }
    const std::string& buffer() const { return buffer_; }
    // Interval and Duration units follow the committed interval unit.
    std::string unitFor(size_t index) const;
    const std::string& lastError() const { return last_error_; }

    // true when NEXT committed the current field
    bool handleKey(Key key);

private:
    ConfigManager* config_;
    std::vector<ConfigField> fields_;
    size_t index_;
    std::string buffer_;
    std::string last_error_;

    bool editingUnit() const;
};
