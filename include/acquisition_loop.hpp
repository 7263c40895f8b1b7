#pragma once
#include <stdint.h>
#include <vector>

#include "periodic_task.hpp"
#include "types.hpp"
#include "data_aggregator.hpp"
#include "ring_buffer.hpp"
#include "sample_source.hpp"

class AppContext;
class View;
class ValuesView;
class PlotView;

// Pages shown while a session runs: 0 live values, 1 elapsed time, 2.. one plot per channel.
struct ActiveViews {
    ValuesView* values = nullptr;
    ValuesView* elapsed = nullptr;
    std::vector<PlotView*> plots;

    size_t count() const;
    View* at(size_t index) const;
};

/**
 * @brief One acquisition session: timed sampling, view refresh and key
 * polling multiplexed on a single thread.
 *
 * Sampling has priority. The sampling period runs from the start of one
 * acquisition to the start of the next. Every suspension goes through
 * Clock::sleepMicros() in slices of at most one second, so a stop request is
 * seen within that bound.
 */
class AcquisitionLoop {
public:
    static const uint64_t KEY_POLL_US = 100000;
    static const uint64_t MAX_SLEEP_US = 1000000;
    static const uint64_t INITIAL_RENDER_COST_US = 330000;
    static const uint64_t DEFER_MARGIN_US = 10000;

    explicit AcquisitionLoop(AppContext* app);
    ~AcquisitionLoop();

    // views may be null or partially filled; they are only used when the context has a display
    void setViews(const ActiveViews* views);

    /**
     * @brief Run one session with the current settings.
     * @return COMPLETED on duration expiry or end of stream, ABORTED on a
     * stop request, FAILED when the source probe fails. The session result
     * is published to the context unless the state is FAILED.
     */
    SessionState run();
    void requestStop();

    SessionState state() const { return state_; }
    uint32_t sampleCount() const { return sample_count_; }
    size_t currentView() const { return cur_view_; }
    const Sample& lastSample() const { return current_; }
    uint64_t renderCostEstimate() const { return render_cost_us_; }

private:
    AppContext* app_;
    const ActiveViews* views_ = nullptr;

    DataAggregator aggregator_;
    RingBuffer ring_;
    PeriodicTask key_task_;
    PeriodicTask view_task_;

    SessionState state_ = SessionState::IDLE;
    bool stop_ = false;
    SessionState stop_state_ = SessionState::COMPLETED;

    // session timeline, microseconds on the context clock
    uint64_t interval_us_ = 0;
    uint64_t start_us_ = 0;
    uint64_t end_us_ = 0;
    uint64_t sample_due_ = 0;
    uint64_t last_sample_us_ = 0;
    uint64_t render_cost_us_ = INITIAL_RENDER_COST_US;
    double dur_fac_ = 1.0;
    uint32_t duration_ = 0;
    uint32_t oversample_ = 0;
    bool plots_ = false;

    uint32_t sample_count_ = 0;
    Sample current_;
    bool new_sample_ = false;
    size_t cur_view_ = 0;
    size_t shown_view_ = 0;
    bool view_deferred_ = false;

    bool hasViews() const;
    bool probe();
    ReadResult acquire(std::vector<float>& values);
    void takeSample();
    void pollKeys();
    void serviceOverrun(uint64_t now);
    void refreshViews();
    void resetViews(const char* dur_scale);
    void finish();
    uint64_t nextWake(uint64_t now) const;
};
