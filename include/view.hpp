#pragma once
#include <string>
#include <vector>

// Screen pages. Implementations swallow their own rendering errors, a
// failing display never interrupts an acquisition.
class View {
public:
    virtual ~View() {}
    virtual void show() = 0;
};

// Up to three live values with their units.
class ValuesView : public View {
public:
    virtual void setValues(const std::vector<float>& values, float elapsed) = 0;
    virtual void clearValues() = 0;
    virtual void setUnits(const std::vector<std::string>& units) = 0;
};

// Trend of one channel.
class PlotView : public View {
public:
    virtual void setSeries(const std::vector<float>& series) = 0;
    virtual void reset() = 0;
};

class ResultView : public View {
public:
    virtual void setValues(float min, float mean, float max) = 0;
};

class ConfigView : public View {
public:
    virtual void setValue(const std::string& value) = 0;
    virtual void setUnit(const std::string& unit) = 0;
};

// Creates the views of one screen; the caller owns the returned objects.
class Display {
public:
    virtual ~Display() {}
    virtual ValuesView* createValuesView(const std::vector<std::string>& units) = 0;
    virtual PlotView* createPlotView(const std::string& unit) = 0;
    virtual ResultView* createResultView(const std::string& unit) = 0;
    virtual ConfigView* createConfigView(const std::string& heading, const std::string& unit) = 0;
};

// Value text as shown on the small screen: 2 decimals below 10,
// 1 decimal below 100, none above.
std::string formatValue(float value, const std::string& unit);
