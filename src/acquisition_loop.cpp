#include "../include/acquisition_loop.hpp"
#include "../include/app_context.hpp"
#include "../include/clock.hpp"
#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/key_input.hpp"
#include "../include/log_writer.hpp"
#include "../include/logger.hpp"
#include "../include/scales.hpp"
#include "../include/view.hpp"
#include <cstdint>

const uint64_t AcquisitionLoop::KEY_POLL_US;
const uint64_t AcquisitionLoop::MAX_SLEEP_US;
const uint64_t AcquisitionLoop::INITIAL_RENDER_COST_US;
const uint64_t AcquisitionLoop::DEFER_MARGIN_US;

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::RUNNING: return "RUNNING";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::ABORTED: return "ABORTED";
        case SessionState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

size_t ActiveViews::count() const {
    return 2 + plots.size();
}

View* ActiveViews::at(size_t index) const {
    if (index == 0) return values;
    if (index == 1) return elapsed;
    if (index - 2 < plots.size()) return plots[index - 2];
    return nullptr;
}

AcquisitionLoop::AcquisitionLoop(AppContext* app)
    : app_(app), key_task_(KEY_POLL_US) {}

AcquisitionLoop::~AcquisitionLoop() {}

void AcquisitionLoop::setViews(const ActiveViews* views) {
    views_ = views;
}

bool AcquisitionLoop::hasViews() const {
    return app_->display() && views_ && views_->values && views_->elapsed;
}

void AcquisitionLoop::requestStop() {
    if (!stop_) stop_state_ = SessionState::ABORTED;
    stop_ = true;
}

SessionState AcquisitionLoop::run() {
    const AcquisitionSettings settings = app_->config()->getAcquisitionSettings();
    SampleSource* source = app_->source();
    Clock* clock = app_->clock();

    stop_ = false;
    stop_state_ = SessionState::COMPLETED;
    state_ = SessionState::IDLE;
    sample_count_ = 0;
    new_sample_ = false;
    view_deferred_ = false;
    current_ = Sample();
    render_cost_us_ = INITIAL_RENDER_COST_US;

    size_t dim = source->channelCount();
    aggregator_.reset(dim);
    ring_.reset(dim);
    interval_us_ = (uint64_t)(settings.interval * Scales::intervalFactor(settings.int_scale) * 1e6);
    dur_fac_ = Scales::durationFactor(settings.int_scale);
    duration_ = settings.duration;
    oversample_ = settings.oversample;
    plots_ = settings.plots;

    resetViews(Scales::durationUnit(settings.int_scale));

    if (!probe()) {
        Logger::error("#data-provider timed out");
        state_ = SessionState::FAILED;
        return state_;
    }

    LogWriter* log = app_->logWriter();
    log->setChannelFormat(source->channelDecimals(), source->channelUnits());
    log->open();
    log->writeSettingsHeader(settings);

    state_ = SessionState::RUNNING;
    start_us_ = clock->micros();
    end_us_ = settings.duration
        ? start_us_ + (uint64_t)(settings.duration * dur_fac_ * 1e6)
        : UINT64_MAX;
    sample_due_ = start_us_;
    last_sample_us_ = start_us_;

    if (app_->keys()) key_task_.start(start_us_);
    if (hasViews() && settings.update > 0) {
        view_task_.interval((uint64_t)settings.update * 1000ULL);
        view_task_.start(start_us_);
    }

    Logger::info("[Acquisition] Session started: dim=%u interval=%.3fs duration=%u%s",
                 (unsigned)dim, (double)interval_us_ / 1e6, (unsigned)settings.duration,
                 Scales::durationUnit(settings.int_scale));

    while (!stop_) {
        uint64_t now = clock->micros();
        if (now >= end_us_) break;

        if (now >= sample_due_) {
            takeSample();
            // An acquisition longer than the interval leaves the next sample
            // already due; keys and views still get their turn.
            now = clock->micros();
            if (!stop_ && now >= sample_due_) serviceOverrun(now);
            continue;
        }
        if (key_task_.isDue(now)) {
            pollKeys();
            key_task_.rearm(clock->micros());
            continue;
        }
        if (view_task_.isDue(now)) {
            // Keep a redraw from pushing the next sample late
            uint64_t gap = sample_due_ - now;
            if (!view_deferred_ && gap < render_cost_us_ && render_cost_us_ < interval_us_) {
                view_task_.deferUntil(sample_due_ + DEFER_MARGIN_US);
                view_deferred_ = true;
                continue;
            }
            view_deferred_ = false;
            refreshViews();
            view_task_.rearm(clock->micros());
            continue;
        }
        clock->sleepMicros(nextWake(now) - now);
    }

    finish();
    return state_;
}

void AcquisitionLoop::serviceOverrun(uint64_t now) {
    Clock* clock = app_->clock();
    if (key_task_.isDue(now)) {
        pollKeys();
        key_task_.rearm(clock->micros());
    }
    if (!stop_ && view_task_.isDue(clock->micros())) {
        view_deferred_ = false;
        refreshViews();
        view_task_.rearm(clock->micros());
    }
}

uint64_t AcquisitionLoop::nextWake(uint64_t now) const {
    uint64_t wake = sample_due_;
    if (key_task_.running() && key_task_.due() < wake) wake = key_task_.due();
    if (view_task_.running() && view_task_.due() < wake) wake = view_task_.due();
    if (end_us_ < wake) wake = end_us_;
    if (wake - now > MAX_SLEEP_US) wake = now + MAX_SLEEP_US;
    return wake;
}

bool AcquisitionLoop::probe() {
    std::vector<float> values;
    try {
        app_->source()->reset();
        return app_->source()->read(values) == ReadResult::OK;
    } catch (const SourceException& e) {
        Logger::error("[Acquisition] Source probe failed: %s", e.what());
        return false;
    }
}

ReadResult AcquisitionLoop::acquire(std::vector<float>& values) {
    SampleSource* source = app_->source();
    try {
        if (oversample_ < 2) {
            return source->read(values);
        }
        size_t dim = source->channelCount();
        std::vector<double> sum(dim, 0.0);
        std::vector<float> raw;
        for (uint32_t n = 0; n < oversample_; ++n) {
            ReadResult result = source->read(raw);
            if (result != ReadResult::OK) return result;
            for (size_t i = 0; i < dim && i < raw.size(); ++i) {
                sum[i] += raw[i];
            }
        }
        values.resize(dim);
        for (size_t i = 0; i < dim; ++i) {
            values[i] = (float)(sum[i] / oversample_);
        }
        return ReadResult::OK;
    } catch (const SourceException& e) {
        Logger::warn("[Acquisition] Source error: %s", e.what());
        return ReadResult::FAILURE;
    }
}

void AcquisitionLoop::takeSample() {
    Clock* clock = app_->clock();
    uint64_t acq_start = clock->micros();
    sample_due_ = acq_start + interval_us_;

    std::vector<float> values;
    ReadResult result = acquire(values);
    if (result == ReadResult::END_OF_STREAM) {
        Logger::info("[Acquisition] End of stream after %u samples", (unsigned)sample_count_);
        stop_state_ = SessionState::COMPLETED;
        stop_ = true;
        return;
    }
    if (result == ReadResult::FAILURE) {
        Logger::warn("[Acquisition] Failed to read sample %u. Skipping.", (unsigned)(sample_count_ + 1));
        return;
    }

    current_.timestamp_us = acq_start;
    current_.values = values;
    last_sample_us_ = acq_start;
    aggregator_.add(values);
    ring_.add(values);
    new_sample_ = true;
    app_->logWriter()->writeSample((double)(acq_start - start_us_) / 1e6, values);
    sample_count_++;
}

void AcquisitionLoop::pollKeys() {
    Key key = app_->keys()->poll(KeyMap::ACTIVE);
    if (key == Key::TOGGLE && hasViews()) {
        cur_view_ = (cur_view_ + 1) % views_->count();
        Logger::debug("[Acquisition] View %u selected", (unsigned)cur_view_);
    } else if (key == Key::STOP) {
        Logger::info("[Acquisition] Stop requested after %u samples", (unsigned)sample_count_);
        requestStop();
    }
}

void AcquisitionLoop::resetViews(const char* dur_scale) {
    cur_view_ = 0;
    shown_view_ = 0;
    if (!hasViews()) return;
    views_->values->clearValues();
    views_->values->show();
    views_->elapsed->setUnits(std::vector<std::string>(2, dur_scale));
    for (size_t i = 0; i < views_->plots.size(); ++i) {
        views_->plots[i]->reset();
    }
}

void AcquisitionLoop::refreshViews() {
    Clock* clock = app_->clock();
    uint64_t started = clock->micros();
    float elapsed = (float)((double)(started - start_us_) / 1e6);

    if (cur_view_ == 0) {
        if (new_sample_) views_->values->setValues(current_.values, elapsed);
    } else if (cur_view_ == 1) {
        std::vector<float> progress;
        progress.push_back((float)(elapsed / dur_fac_));
        progress.push_back((float)duration_);
        views_->elapsed->setValues(progress, -1.0f);
    } else if (plots_ && (new_sample_ || shown_view_ != cur_view_)) {
        views_->plots[cur_view_ - 2]->setSeries(ring_.get(cur_view_ - 2));
    }

    if (new_sample_ || !app_->keys() || cur_view_ == 1 || shown_view_ != cur_view_) {
        View* view = views_->at(cur_view_);
        if (view) view->show();
        shown_view_ = cur_view_;
        render_cost_us_ = clock->micros() - started;
    }
    new_sample_ = false;

    // Without a keypad cycle through the pages
    if (!app_->keys()) {
        cur_view_ = (cur_view_ + 1) % views_->count();
    }
}

void AcquisitionLoop::finish() {
    key_task_.stop();
    view_task_.stop();
    state_ = stop_ ? stop_state_ : SessionState::COMPLETED;

    SessionResult result;
    result.state = state_;
    result.sample_count = sample_count_;
    result.elapsed_s = sample_count_ ? (double)(last_sample_us_ - start_us_) / 1e6 : 0.0;
    result.valid = aggregator_.get(result.values);
    if (plots_) result.plots = ring_.getAll();
    if (!result.valid) {
        Logger::warn("[Acquisition] Session ended without samples");
    }

    LogWriter* log = app_->logWriter();
    log->writeSummary(sample_count_, result.elapsed_s, result.values);
    log->close();

    app_->publish(result);
    Logger::info("[Acquisition] Session %s: %u samples", sessionStateToString(state_), (unsigned)sample_count_);
}
