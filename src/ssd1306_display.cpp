#include "../include/ssd1306_display.hpp"
#include "../include/logger.hpp"
#include <Wire.h>
#include <Adafruit_GFX.h>
#include <Adafruit_SSD1306.h>
#include <Fonts/FreeMonoBold9pt7b.h>
#include <Fonts/FreeMonoBold18pt7b.h>
#include <cfloat>

namespace {

const GFXfont* FONT_T = nullptr;  // built-in 5x7
const GFXfont* FONT_S = &FreeMonoBold9pt7b;
const GFXfont* FONT_L = &FreeMonoBold18pt7b;

const int LAYOUT_W = 128;
const int LAYOUT_H = 64;
const size_t PLOT_POINTS = 64;

enum class Anchor { NW, NE, W, E, SW, SE };

struct Label {
    std::string text;
    Anchor anchor;
    const GFXfont* font;
};

// Common drawing of one page: optional border plus anchored labels.
class OledPage {
public:
    OledPage(Adafruit_SSD1306* oled, const DisplayConfig& cfg)
        : oled_(oled), border_(cfg.border) {
        offset_ = border_ ? border_ + 2 : 0;
        off_w_ = oled_ ? (oled_->width() - LAYOUT_W) / 2 : 0;
        off_h_ = oled_ ? (oled_->height() - LAYOUT_H) / 2 : 0;
    }

    size_t add(const std::string& text, Anchor anchor, const GFXfont* font) {
        Label label = {text, anchor, font};
        labels_.push_back(label);
        return labels_.size() - 1;
    }

    void setText(size_t index, const std::string& text) {
        if (index < labels_.size()) labels_[index].text = text;
    }

    void begin() {
        oled_->clearDisplay();
        if (border_) {
            for (int i = 0; i < border_; i++) {
                oled_->drawRect(i, i, oled_->width() - 2 * i, oled_->height() - 2 * i, SSD1306_WHITE);
            }
        }
        for (size_t i = 0; i < labels_.size(); i++) draw(labels_[i]);
    }

    void end() {
        oled_->display();
    }

    int left() const { return offset_ + off_w_; }
    int top() const { return offset_ + off_h_; }
    int right() const { return oled_->width() - offset_ - off_w_; }
    int bottom() const { return oled_->height() - offset_ - off_h_; }

    Adafruit_SSD1306* oled() const { return oled_; }

private:
    Adafruit_SSD1306* oled_;
    int border_;
    int offset_;
    int off_w_;
    int off_h_;
    std::vector<Label> labels_;

    void draw(const Label& label) {
        int16_t x1, y1;
        uint16_t w, h;
        oled_->setFont(label.font);
        oled_->setTextSize(1);
        oled_->setTextColor(SSD1306_WHITE);
        oled_->getTextBounds(label.text.c_str(), 0, 0, &x1, &y1, &w, &h);

        int x = left() - x1;
        if (label.anchor == Anchor::NE || label.anchor == Anchor::E || label.anchor == Anchor::SE) {
            x = right() - (int)w - x1;
        }
        int y;
        switch (label.anchor) {
            case Anchor::NW:
            case Anchor::NE:
                y = top() - y1;
                break;
            case Anchor::W:
            case Anchor::E:
                y = oled_->height() / 2 - (int)h / 2 - y1;
                break;
            default:
                y = bottom() - (int)h - y1;
                break;
        }
        oled_->setCursor(x, y);
        oled_->print(label.text.c_str());
    }
};

class OledValuesView : public ValuesView {
public:
    OledValuesView(Adafruit_SSD1306* oled, const DisplayConfig& cfg, const std::vector<std::string>& units)
        : page_(oled, cfg) {
        const Anchor two[] = {Anchor::NE, Anchor::SE};
        const Anchor three[] = {Anchor::NE, Anchor::E, Anchor::SE};
        bool large = units.size() < 3;
        units_.assign(units.begin(), units.begin() + (units.size() < 3 ? units.size() : 3));
        for (size_t i = 0; i < units_.size(); i++) {
            page_.add(units_[i], large ? two[i] : three[i], large ? FONT_L : FONT_S);
        }
    }

    void setValues(const std::vector<float>& values, float) override {
        for (size_t i = 0; i < values.size() && i < units_.size(); i++) {
            page_.setText(i, formatValue(values[i], units_[i]));
        }
    }

    void clearValues() override {
        for (size_t i = 0; i < units_.size(); i++) page_.setText(i, units_[i]);
    }

    void setUnits(const std::vector<std::string>& units) override {
        for (size_t i = 0; i < units.size() && i < units_.size(); i++) units_[i] = units[i];
    }

    void show() override {
        page_.begin();
        page_.end();
    }

private:
    OledPage page_;
    std::vector<std::string> units_;
};

class OledResultView : public ResultView {
public:
    OledResultView(Adafruit_SSD1306* oled, const DisplayConfig& cfg, const std::string& unit)
        : page_(oled, cfg), unit_(unit) {
        page_.add("min:", Anchor::NW, FONT_S);
        min_ = page_.add("0.00", Anchor::NE, FONT_S);
        page_.add("mean:", Anchor::W, FONT_S);
        mean_ = page_.add("0.00", Anchor::E, FONT_S);
        page_.add("max:", Anchor::SW, FONT_S);
        max_ = page_.add("0.00", Anchor::SE, FONT_S);
    }

    void setValues(float min, float mean, float max) override {
        page_.setText(min_, formatValue(min, unit_));
        page_.setText(mean_, formatValue(mean, unit_));
        page_.setText(max_, formatValue(max, unit_));
    }

    void show() override {
        page_.begin();
        page_.end();
    }

private:
    OledPage page_;
    std::string unit_;
    size_t min_;
    size_t mean_;
    size_t max_;
};

class OledConfigView : public ConfigView {
public:
    OledConfigView(Adafruit_SSD1306* oled, const DisplayConfig& cfg,
                   const std::string& heading, const std::string& unit)
        : page_(oled, cfg), unit_(unit) {
        page_.add(heading, Anchor::NW, FONT_S);
        value_ = page_.add(" ", Anchor::SE, FONT_L);
    }

    void setValue(const std::string& value) override {
        page_.setText(value_, value + unit_);
    }

    void setUnit(const std::string& unit) override {
        unit_ = unit;
    }

    void show() override {
        page_.begin();
        page_.end();
    }

private:
    OledPage page_;
    std::string unit_;
    size_t value_;
};

// Line plot of the most recent values scaled to their own range.
class OledPlotView : public PlotView {
public:
    OledPlotView(Adafruit_SSD1306* oled, const DisplayConfig& cfg, const std::string& unit)
        : page_(oled, cfg), unit_(unit) {
        value_ = page_.add("0.00", Anchor::NW, FONT_T);
    }

    void setSeries(const std::vector<float>& series) override {
        if (series.size() > PLOT_POINTS) {
            series_.assign(series.end() - PLOT_POINTS, series.end());
        } else {
            series_ = series;
        }
        if (!series_.empty()) page_.setText(value_, formatValue(series_.back(), unit_));
    }

    void reset() override {
        series_.clear();
        page_.setText(value_, "0.00");
    }

    void show() override {
        page_.begin();
        drawSeries();
        page_.end();
    }

private:
    OledPage page_;
    std::string unit_;
    size_t value_;
    std::vector<float> series_;

    void drawSeries() {
        if (series_.size() < 2) return;
        float lo = FLT_MAX;
        float hi = -FLT_MAX;
        for (size_t i = 0; i < series_.size(); i++) {
            if (series_[i] < lo) lo = series_[i];
            if (series_[i] > hi) hi = series_[i];
        }
        float span = hi - lo;
        if (span <= 0.0f) span = 1.0f;

        int x0 = page_.left();
        int y0 = page_.top();
        int w = page_.right() - x0 - 1;
        int h = page_.bottom() - y0 - 1;
        int prev_x = 0, prev_y = 0;
        for (size_t i = 0; i < series_.size(); i++) {
            int x = x0 + (int)(i * w / (PLOT_POINTS - 1));
            int y = y0 + h - (int)((series_[i] - lo) / span * h);
            if (i > 0) page_.oled()->drawLine(prev_x, prev_y, x, y, SSD1306_WHITE);
            prev_x = x;
            prev_y = y;
        }
    }
};

}  // namespace

Ssd1306Display::Ssd1306Display(const DisplayConfig& cfg)
    : cfg_(cfg), oled_(new Adafruit_SSD1306(cfg.width, cfg.height, &Wire, -1)), ready_(false) {}

Ssd1306Display::~Ssd1306Display() {
    delete oled_;
}

bool Ssd1306Display::begin() {
    ready_ = oled_->begin(SSD1306_SWITCHCAPVCC, cfg_.i2c_address);
    if (!ready_) {
        Logger::error("[Display] SSD1306 allocation or init failed at 0x%02X", cfg_.i2c_address);
        return false;
    }
    oled_->clearDisplay();
    oled_->display();
    Logger::info("[Display] SSD1306 %ux%u ready", (unsigned)cfg_.width, (unsigned)cfg_.height);
    return true;
}

ValuesView* Ssd1306Display::createValuesView(const std::vector<std::string>& units) {
    return new OledValuesView(oled_, cfg_, units);
}

PlotView* Ssd1306Display::createPlotView(const std::string& unit) {
    return new OledPlotView(oled_, cfg_, unit);
}

ResultView* Ssd1306Display::createResultView(const std::string& unit) {
    return new OledResultView(oled_, cfg_, unit);
}

ConfigView* Ssd1306Display::createConfigView(const std::string& heading, const std::string& unit) {
    return new OledConfigView(oled_, cfg_, heading, unit);
}
