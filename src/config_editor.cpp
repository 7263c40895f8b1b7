#include "../include/config_editor.hpp"
#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include "../include/scales.hpp"

ConfigEditor::ConfigEditor(ConfigManager* config, const std::vector<ConfigItem>& source_items)
    : config_(config), index_(0) {
    const AcquisitionSettings& settings = config_->getAcquisitionSettings();
    fields_.push_back({"Int-Scale:", "int_scale", ""});
    fields_.push_back({"Interval:", "interval", settings.int_scale});
    fields_.push_back({"Duration:", "duration", Scales::durationUnit(settings.int_scale)});
    fields_.push_back({"Update:", "update", "ms"});
    // Oversampling is only offered when it was enabled in the stored settings
    if (settings.oversample > 0) {
        fields_.push_back({"Oversample:", "oversample", "X"});
    }
    for (size_t i = 0; i < source_items.size(); i++) {
        if (!config_->hasKey(source_items[i].key)) {
            Logger::warn("[ConfigEditor] Source setting %s is not registered, skipped", source_items[i].key.c_str());
            continue;
        }
        fields_.push_back({source_items[i].heading, source_items[i].key, source_items[i].unit});
    }
}

void ConfigEditor::begin(size_t index) {
    index_ = index < fields_.size() ? index : 0;
    buffer_ = config_->getValue(fields_[index_].key);
    last_error_.clear();
}

bool ConfigEditor::editingUnit() const {
    return fields_[index_].key == "int_scale";
}

std::string ConfigEditor::unitFor(size_t index) const {
    if (index >= fields_.size()) return "";
    const std::string& key = fields_[index].key;
    const std::string& int_scale = config_->getAcquisitionSettings().int_scale;
    if (key == "interval") return int_scale;
    if (key == "duration") return Scales::durationUnit(int_scale);
    return fields_[index].unit;
}

bool ConfigEditor::handleKey(Key key) {
    if (key == Key::NEXT) {
        std::string reason;
        if (config_->setValue(fields_[index_].key, buffer_, reason)) {
            last_error_.clear();
            return true;
        }
        last_error_ = reason;
        buffer_ = config_->getValue(fields_[index_].key);
        return false;
    }

    if (key == Key::CLR) {
        if (editingUnit()) {
            buffer_ = "ms";
        } else if (buffer_.size() > 1) {
            buffer_.erase(buffer_.size() - 1);
        } else {
            buffer_ = "0";
        }
        return false;
    }

    if (!isDigitKey(key)) {
        Logger::debug("[ConfigEditor] Key %s ignored", keyToString(key));
        return false;
    }

    int digit = keyChar(key) - '0';
    if (editingUnit()) {
        // 1..5 pick a unit, larger digits the last one, 0 wraps to the last one too
        size_t count = Scales::unitCount();
        size_t index = digit == 0 ? count - 1 : ((size_t)digit < count ? (size_t)digit : count) - 1;
        buffer_ = Scales::unitAt(index);
    } else if (buffer_ == "0") {
        buffer_ = std::string(1, keyChar(key));
    } else {
        buffer_ += keyChar(key);
    }
    return false;
}
