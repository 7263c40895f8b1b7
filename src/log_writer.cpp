#include "../include/log_writer.hpp"
#include "../include/scales.hpp"
#include "../include/logger.hpp"
#include <cstdio>

LogWriter::LogWriter(LogSink* sink)
    : sink_(sink), open_(false), dropped_(0), int_scale_("s"), dur_scale_("m"), int_fac_(1.0), dur_fac_(60.0) {}

void LogWriter::open() {
    dropped_ = 0;
    if (!sink_) return;
    open_ = sink_->open();
    if (!open_) {
        Logger::warn("[LogWriter] Sink failed to open, data log disabled for this session");
    }
}

void LogWriter::close() {
    if (sink_ && open_) sink_->close();
    open_ = false;
    if (dropped_ > 0) {
        Logger::warn("[LogWriter] %u data-log lines dropped", (unsigned)dropped_);
    }
}

void LogWriter::emit(const std::string& line) {
    if (!sink_ || !open_) return;
    if (!sink_->write(line)) {
        dropped_++;
        Logger::debug("[LogWriter] Sink write failed");
    }
}

void LogWriter::setChannelFormat(const std::vector<int>& decimals, const std::vector<std::string>& units) {
    decimals_ = decimals;
    units_ = units;
}

void LogWriter::writeSettingsHeader(const AcquisitionSettings& settings) {
    // Units are validated at edit time, a bad one here is a programming error
    int_scale_ = settings.int_scale;
    int_fac_ = Scales::intervalFactor(settings.int_scale);
    dur_scale_ = Scales::durationUnit(settings.int_scale);
    dur_fac_ = Scales::durationFactor(settings.int_scale);

    char buf[64];
    emit("#\n");
    snprintf(buf, sizeof(buf), "#Interval:   %u%s\n", (unsigned)settings.interval, int_scale_.c_str());
    emit(buf);
    if (settings.oversample > 0) {
        snprintf(buf, sizeof(buf), "#Oversampling: %uX\n", (unsigned)settings.oversample);
        emit(buf);
    }
    snprintf(buf, sizeof(buf), "#Duration:     %u%s\n", (unsigned)settings.duration, dur_scale_.c_str());
    emit(buf);
    snprintf(buf, sizeof(buf), "#Update:       %ums\n", (unsigned)settings.update);
    emit(buf);
    emit("#\n");
}

std::string LogWriter::formatSample(double elapsed_s, const std::vector<float>& values) const {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f", 1000.0 * elapsed_s);
    std::string line(buf);
    for (size_t i = 0; i < values.size(); i++) {
        int decimals = i < decimals_.size() ? decimals_[i] : 3;
        snprintf(buf, sizeof(buf), ",%.*f", decimals, (double)values[i]);
        line += buf;
    }
    line += "\n";
    return line;
}

void LogWriter::writeSample(double elapsed_s, const std::vector<float>& values) {
    emit(formatSample(elapsed_s, values));
}

void LogWriter::writeSummary(uint32_t sample_count, double elapsed_s, const ResultSet& results) {
    char buf[96];
    emit("#\n");
    snprintf(buf, sizeof(buf), "#Duration: %.1f%s\n", elapsed_s / dur_fac_, dur_scale_.c_str());
    emit(buf);
    if (elapsed_s > 0.0) {
        snprintf(buf, sizeof(buf), "#Samples: %u (%.1f/s)\n", (unsigned)sample_count, sample_count / elapsed_s);
    } else {
        snprintf(buf, sizeof(buf), "#Samples: %u\n", (unsigned)sample_count);
    }
    emit(buf);
    if (sample_count == 0) return;

    snprintf(buf, sizeof(buf), "#Mean Interval: %.1f%s\n",
             elapsed_s / int_fac_ / sample_count, int_scale_.c_str());
    emit(buf);
    emit("#Min,Mean,Max\n");
    for (size_t i = 0; i < results.size(); i++) {
        const char* unit = i < units_.size() ? units_[i].c_str() : "";
        snprintf(buf, sizeof(buf), "#%.2f%s,%.2f%s,%.2f%s\n",
                 (double)results[i].min, unit, (double)results[i].mean, unit, (double)results[i].max, unit);
        emit(buf);
    }
}
