#pragma once
#include <stdint.h>
#include "config_manager.hpp"
#include "view.hpp"

class Adafruit_SSD1306;

/**
 * @brief Views on a 128x64 SSD1306 OLED driven through Adafruit_GFX.
 *
 * All views share one frame buffer; show() redraws the whole screen.
 * Larger panels keep the 128x64 layout centred.
 */
class Ssd1306Display : public Display {
public:
    explicit Ssd1306Display(const DisplayConfig& cfg);
    ~Ssd1306Display();

    // Wire must already be started. false if the panel does not answer.
    bool begin();
    bool ready() const { return ready_; }

    ValuesView* createValuesView(const std::vector<std::string>& units) override;
    PlotView* createPlotView(const std::string& unit) override;
    ResultView* createResultView(const std::string& unit) override;
    ConfigView* createConfigView(const std::string& heading, const std::string& unit) override;

private:
    DisplayConfig cfg_;
    Adafruit_SSD1306* oled_;
    bool ready_;
};
