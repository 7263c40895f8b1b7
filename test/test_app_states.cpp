/**
 * Ready/active/config state machine with scripted keys and a recording display.
 */

#include "test_support.hpp"
#include "../include/app_context.hpp"
#include "../include/app_states.hpp"
#include "../include/config_manager.hpp"
#include "../include/logger.hpp"

struct AppRig {
    FakeClock clock;
    ConfigManager config;
    ScriptedSource source;
    RecordingSink sink;
    LogWriter log;
    RecordingDisplay display;
    ScriptedKeys keys;
    AppContext context;

    AppRig(bool with_display, bool with_keys)
        : source(&clock, 2), sink(&clock), log(&sink), display(&clock),
          context(&clock, &config, &source, &log,
                  with_display ? &display : nullptr, with_keys ? &keys : nullptr) {
        AcquisitionSettings s = config.getAcquisitionSettings();
        s.int_scale = "ms";
        s.interval = 100;
        s.duration = 1;
        s.update = 200;
        std::string reason;
        config.applySettings(s, reason);
    }
};

bool test_headless_runs_once_and_exits() {
    printTestHeader("TEST 1: No keypad: session first, then exit");
    AppRig rig(true, false);
    rig.config.setExitAfterSession(true);
    rig.config.setPlots(true);

    VaMeterApp app(&rig.context);
    CHECK(app.state() == AppState::ACTIVE);
    CHECK(app.step() == AppState::READY);
    CHECK(rig.context.publishCount() == 1);
    CHECK(rig.context.lastResult().sample_count == 10);
    CHECK(rig.display.values_views == 2);
    CHECK(rig.display.plot_views == 2);

    CHECK(app.step() == AppState::EXIT);
    CHECK(rig.display.result_views == 2);
    // result plots are rebuilt from the published snapshot
    CHECK(rig.display.plot_views == 4);
    CHECK(rig.display.showed("result 1.00V 1.00V 1.00V"));
    return true;
}

bool test_ready_without_result() {
    printTestHeader("TEST 2: Ready state before the first session");
    AppRig rig(true, true);
    rig.keys.waits.push_back(Key::TOGGLE);
    rig.keys.waits.push_back(Key::START);

    ReadyState ready(&rig.context);
    CHECK(ready.run() == AppState::ACTIVE);
    CHECK(ready.viewCount() == 2);
    CHECK(rig.display.showed("result 0.00V 0.00V 0.00V"));
    CHECK(rig.display.showed("result 0.00mA 0.00mA 0.00mA"));
    CHECK(rig.keys.waits.empty());
    return true;
}

bool test_exit_key() {
    printTestHeader("TEST 3: EXIT only with exit_after_session");
    AppRig rig(true, true);
    rig.keys.waits.push_back(Key::EXIT);
    rig.keys.waits.push_back(Key::CONFIG);
    ReadyState ready(&rig.context);
    CHECK(ready.run() == AppState::CONFIG);

    rig.config.setExitAfterSession(true);
    rig.keys.waits.push_back(Key::EXIT);
    CHECK(ready.run() == AppState::EXIT);
    return true;
}

bool test_ready_without_display() {
    printTestHeader("TEST 4: Headless device goes straight to a session");
    AppRig rig(false, false);
    ReadyState ready(&rig.context);
    CHECK(ready.run() == AppState::ACTIVE);
    ConfigState config(&rig.context);
    CHECK(!config.run());
    return true;
}

bool test_config_session() {
    printTestHeader("TEST 5: Config session from the ready state");
    AppRig rig(true, true);
    int saved = 0;
    VaMeterApp app(&rig.context);
    app.onConfigSaved([&saved]() { saved++; });
    CHECK(app.state() == AppState::READY);

    const Key script[] = {
        Key::CONFIG,
        Key::NEXT,                                           // Int-Scale: ms
        Key::CLR, Key::CLR, Key::DIGIT_5, Key::NEXT,           // Interval: 100 -> 1 -> 15
        Key::DIGIT_3, Key::NEXT,                             // Duration: 0 -> 3
        Key::NEXT                                            // Update: 200
    };
    for (size_t i = 0; i < sizeof(script) / sizeof(script[0]); i++) {
        rig.keys.waits.push_back(script[i]);
    }

    CHECK(app.step() == AppState::CONFIG);
    CHECK(app.step() == AppState::READY);
    CHECK(saved == 1);
    CHECK(rig.keys.waits.empty());
    CHECK(rig.display.config_views == 4);
    CHECK(rig.display.showed("Interval: 15ms"));
    CHECK(rig.config.getAcquisitionSettings().interval == 15);
    CHECK(rig.config.getAcquisitionSettings().duration == 3);
    CHECK(rig.config.getAcquisitionSettings().update == 200);
    return true;
}

bool test_active_state_views() {
    printTestHeader("TEST 6: Active state builds fresh views per session");
    AppRig rig(true, true);
    rig.config.setPlots(true);
    ActiveState active(&rig.context);
    CHECK(active.run() == SessionState::COMPLETED);
    CHECK(rig.display.values_views == 2);
    CHECK(rig.display.plot_views == 2);
    CHECK(rig.display.showed("values cleared"));
    CHECK(rig.display.showed("values 1.00V 1.00mA"));

    CHECK(active.run() == SessionState::COMPLETED);
    CHECK(rig.display.values_views == 4);
    CHECK(rig.context.publishCount() == 2);
    return true;
}

bool test_failed_session_returns_to_ready() {
    printTestHeader("TEST 7: Failed probe returns to ready with the old result");
    AppRig rig(true, true);
    rig.source.fail_first = true;
    rig.keys.waits.push_back(Key::START);
    VaMeterApp app(&rig.context);
    CHECK(app.step() == AppState::ACTIVE);
    CHECK(app.step() == AppState::READY);
    CHECK(!rig.context.hasResult());
    return true;
}

int main() {
    LoggingConfig logging;
    logging.log_level = "WARN";
    logging.flush_on_write = true;
    Logger::begin(logging);

    bool ok;
    try {
        printTestResult("Headless run", test_headless_runs_once_and_exits());
        printTestResult("Ready without result", test_ready_without_result());
        printTestResult("Exit key", test_exit_key());
        printTestResult("Ready without display", test_ready_without_display());
        printTestResult("Config session", test_config_session());
        printTestResult("Active state views", test_active_state_views());
        printTestResult("Failed session", test_failed_session_returns_to_ready());
        ok = true;
    } catch (const std::exception& e) {
        printf("Unexpected exception: %s\n", e.what());
        ok = false;
    }
    printTestResult("No exhausted key script", ok);
    return printSummary();
}
