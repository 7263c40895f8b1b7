#include "../include/app_context.hpp"
#include "../include/logger.hpp"

AppContext::AppContext(Clock* clock, ConfigManager* config, SampleSource* source,
                       LogWriter* log_writer, Display* display, KeyInput* keys)
    : clock_(clock), config_(config), source_(source), log_writer_(log_writer),
      display_(display), keys_(keys), publish_count_(0) {}

void AppContext::publish(const SessionResult& result) {
    last_result_ = result;
    publish_count_++;
    Logger::info("[App] Session result published: %s, %u samples in %.1fs%s",
                 sessionStateToString(result.state), (unsigned)result.sample_count,
                 result.elapsed_s, result.valid ? "" : " (degenerate)");
}
