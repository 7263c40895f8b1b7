#pragma once
#include <stdint.h>
#include <functional>
#include <vector>

#include "acquisition_loop.hpp"
#include "types.hpp"

class AppContext;
class View;
class ResultView;
class PlotView;
class ConfigView;

enum class AppState {
    READY,
    ACTIVE,
    CONFIG,
    EXIT
};

const char* appStateToString(AppState state);

// Shows the last session result and waits for START, CONFIG or EXIT.
class ReadyState {
public:
    static const uint64_t AUTO_ROTATE_US = 2000000;
    static const uint64_t DEBOUNCE_US = 100000;

    explicit ReadyState(AppContext* app);
    ~ReadyState();

    AppState run();
    size_t viewCount() const { return result_views_.size() + plot_views_.size(); }

private:
    AppContext* app_;
    std::vector<ResultView*> result_views_;
    std::vector<PlotView*> plot_views_;

    void buildViews();
    void clearViews();
    View* viewAt(size_t index) const;
};

// Runs one acquisition session with freshly built live views.
class ActiveState {
public:
    explicit ActiveState(AppContext* app);
    ~ActiveState();

    SessionState run();
    AcquisitionLoop& loop() { return loop_; }

private:
    AppContext* app_;
    AcquisitionLoop loop_;
    ActiveViews views_;

    void buildViews();
    void clearViews();
};

// Walks through every editable setting once.
class ConfigState {
public:
    explicit ConfigState(AppContext* app);

    // false when nothing could be edited (no display or no keypad)
    bool run();

private:
    AppContext* app_;
};

/**
 * @brief ready -> active/config -> ready state machine of the instrument.
 *
 * Starts in READY when a keypad is attached, otherwise straight in ACTIVE.
 */
class VaMeterApp {
public:
    explicit VaMeterApp(AppContext* app);
    ~VaMeterApp();

    AppState step();
    void run();
    AppState state() const { return state_; }
    ActiveState& active() { return active_; }
    void onConfigSaved(std::function<void()> callback);

private:
    AppContext* app_;
    ReadyState ready_;
    ActiveState active_;
    ConfigState config_;
    AppState state_;
    std::function<void()> onConfigSavedCallback_ = nullptr;
};
