#include "../include/app_states.hpp"
#include "../include/app_context.hpp"
#include "../include/clock.hpp"
#include "../include/config_editor.hpp"
#include "../include/config_manager.hpp"
#include "../include/key_input.hpp"
#include "../include/logger.hpp"
#include "../include/sample_source.hpp"
#include "../include/view.hpp"

const uint64_t ReadyState::AUTO_ROTATE_US;
const uint64_t ReadyState::DEBOUNCE_US;

const char* appStateToString(AppState state) {
    switch (state) {
        case AppState::READY: return "READY";
        case AppState::ACTIVE: return "ACTIVE";
        case AppState::CONFIG: return "CONFIG";
        case AppState::EXIT: return "EXIT";
    }
    return "UNKNOWN";
}

// --- ReadyState ---

ReadyState::ReadyState(AppContext* app) : app_(app) {}

ReadyState::~ReadyState() {
    clearViews();
}

void ReadyState::clearViews() {
    for (size_t i = 0; i < result_views_.size(); i++) delete result_views_[i];
    for (size_t i = 0; i < plot_views_.size(); i++) delete plot_views_[i];
    result_views_.clear();
    plot_views_.clear();
}

void ReadyState::buildViews() {
    clearViews();
    Display* display = app_->display();
    std::vector<std::string> units = app_->source()->channelUnits();
    for (size_t i = 0; i < units.size(); i++) {
        result_views_.push_back(display->createResultView(units[i]));
    }

    const SessionResult& result = app_->lastResult();
    const AcquisitionSettings& settings = app_->config()->getAcquisitionSettings();
    for (size_t i = 0; i < result_views_.size(); i++) {
        if (app_->hasResult() && result.valid && i < result.values.size()) {
            result_views_[i]->setValues(result.values[i].min, result.values[i].mean, result.values[i].max);
        } else {
            result_views_[i]->setValues(0.0f, 0.0f, 0.0f);
        }
    }

    if (settings.plots && settings.update && app_->hasResult() && result.plots.size() == units.size()) {
        for (size_t i = 0; i < units.size(); i++) {
            PlotView* plot = display->createPlotView(units[i]);
            plot->setSeries(result.plots[i]);
            plot_views_.push_back(plot);
        }
    }
}

View* ReadyState::viewAt(size_t index) const {
    if (index < result_views_.size()) return result_views_[index];
    return plot_views_[index - result_views_.size()];
}

AppState ReadyState::run() {
    if (!app_->display()) {
        return AppState::ACTIVE;
    }

    buildViews();
    size_t n_views = viewCount();
    size_t cur_view = 0;
    if (n_views) viewAt(cur_view)->show();

    const AcquisitionSettings& settings = app_->config()->getAcquisitionSettings();
    KeyInput* keys = app_->keys();
    while (true) {
        Key key;
        if (!keys) {
            if (settings.exit_after_session) return AppState::EXIT;
            key = Key::TOGGLE;
            app_->clock()->sleepMicros(AUTO_ROTATE_US);
        } else {
            key = keys->wait(KeyMap::READY);
        }

        if (key == Key::START) {
            return AppState::ACTIVE;
        } else if (key == Key::CONFIG) {
            return AppState::CONFIG;
        } else if (key == Key::EXIT) {
            // Leaving the application only makes sense on a host
            if (settings.exit_after_session) return AppState::EXIT;
        } else if (n_views) {
            cur_view = (cur_view + 1) % n_views;
            viewAt(cur_view)->show();
            app_->clock()->sleepMicros(DEBOUNCE_US);
        }
    }
}

// --- ActiveState ---

ActiveState::ActiveState(AppContext* app) : app_(app), loop_(app) {}

ActiveState::~ActiveState() {
    clearViews();
}

void ActiveState::clearViews() {
    delete views_.values;
    delete views_.elapsed;
    for (size_t i = 0; i < views_.plots.size(); i++) delete views_.plots[i];
    views_.values = nullptr;
    views_.elapsed = nullptr;
    views_.plots.clear();
}

void ActiveState::buildViews() {
    clearViews();
    Display* display = app_->display();
    if (!display) return;
    std::vector<std::string> units = app_->source()->channelUnits();
    views_.values = display->createValuesView(units);
    views_.elapsed = display->createValuesView(std::vector<std::string>(2, "s"));
    if (app_->config()->getAcquisitionSettings().plots) {
        for (size_t i = 0; i < units.size(); i++) {
            views_.plots.push_back(display->createPlotView(units[i]));
        }
    }
}

SessionState ActiveState::run() {
    buildViews();
    loop_.setViews(&views_);
    return loop_.run();
}

// --- ConfigState ---

ConfigState::ConfigState(AppContext* app) : app_(app) {}

bool ConfigState::run() {
    Display* display = app_->display();
    KeyInput* keys = app_->keys();
    if (!display || !keys) {
        return false;
    }

    ConfigEditor editor(app_->config(), app_->source()->configItems());
    const std::vector<ConfigField>& fields = editor.fields();
    for (size_t i = 0; i < fields.size(); i++) {
        ConfigView* view = display->createConfigView(fields[i].heading, editor.unitFor(i));
        editor.begin(i);
        while (true) {
            view->setUnit(editor.unitFor(i));
            view->setValue(editor.buffer());
            view->show();
            if (editor.handleKey(keys->wait(KeyMap::CONFIG))) break;
            if (!editor.lastError().empty()) {
                Logger::warn("[Config] %s", editor.lastError().c_str());
            }
        }
        delete view;
    }
    return true;
}

// --- VaMeterApp ---

VaMeterApp::VaMeterApp(AppContext* app)
    : app_(app), ready_(app), active_(app), config_(app),
      state_(app->keys() ? AppState::READY : AppState::ACTIVE) {}

VaMeterApp::~VaMeterApp() {}

void VaMeterApp::onConfigSaved(std::function<void()> callback) {
    onConfigSavedCallback_ = callback;
}

AppState VaMeterApp::step() {
    AppState next = AppState::EXIT;
    switch (state_) {
        case AppState::READY:
            next = ready_.run();
            break;
        case AppState::ACTIVE: {
            SessionState outcome = active_.run();
            Logger::info("[App] Session finished: %s", sessionStateToString(outcome));
            next = AppState::READY;
            break;
        }
        case AppState::CONFIG:
            if (config_.run() && onConfigSavedCallback_) {
                onConfigSavedCallback_();
            }
            next = AppState::READY;
            break;
        case AppState::EXIT:
            break;
    }
    if (next != state_) {
        Logger::debug("[App] %s -> %s", appStateToString(state_), appStateToString(next));
    }
    state_ = next;
    return state_;
}

void VaMeterApp::run() {
    while (step() != AppState::EXIT) {
    }
}
