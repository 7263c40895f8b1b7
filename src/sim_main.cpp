// Runs the instrument on a development machine: synthetic source, console
// display, data log on stdout. Exits after one session.

#include "../include/app_context.hpp"
#include "../include/app_states.hpp"
#include "../include/config_manager.hpp"
#include "../include/fake_source.hpp"
#include "../include/host_platform.hpp"
#include "../include/log_writer.hpp"
#include "../include/logger.hpp"

int main() {
    SteadyClock clock;
    ConfigManager config;

    AcquisitionSettings settings = config.getAcquisitionSettings();
    settings.int_scale = "ms";
    settings.interval = 500;
    settings.duration = 10;
    settings.update = 1000;
    settings.plots = true;
    settings.exit_after_session = true;
    std::string reason;
    if (!config.applySettings(settings, reason)) {
        Logger::error("Invalid simulator settings: %s", reason.c_str());
        return 1;
    }

    Logger::begin(config.getLoggingConfig(), &clock);

    FakeSource source(&clock, &config, 2);
    StdoutLogSink sink;
    LogWriter log_writer(&sink);
    ConsoleDisplay display;
    AppContext context(&clock, &config, &source, &log_writer, &display, nullptr);

    VaMeterApp app(&context);
    app.run();

    Logger::shutdown();
    const SessionResult& result = context.lastResult();
    return context.hasResult() && result.state != SessionState::FAILED ? 0 : 1;
}
