#include "transit_presence/power_monitor.hpp"

#include <stdexcept>

#include "transit_presence/errors.hpp"

namespace transit_presence {

SimulatedPowerSource::SimulatedPowerSource(PowerStatus initial)
    : status_(initial) {}

PowerStatus SimulatedPowerSource::read() {
    std::scoped_lock lock(mutex_);
    ++reads_;
    if (failing_) {
        throw PresenceError(ErrorKind::LocationError, "battery service unavailable");
    }
    return status_;
}

void SimulatedPowerSource::set(PowerStatus status) {
    std::scoped_lock lock(mutex_);
    status_ = status;
}

void SimulatedPowerSource::set_failing(bool failing) {
    std::scoped_lock lock(mutex_);
    failing_ = failing;
}

int SimulatedPowerSource::reads() const {
    std::scoped_lock lock(mutex_);
    return reads_;
}

PowerMonitor::PowerMonitor(PowerStatusSourcePtr source, SchedulerPtr clock, Duration cache_ttl)
    : source_(std::move(source)),
      clock_(std::move(clock)),
      cache_ttl_(cache_ttl),
      logger_(get_logger()) {
    if (source_ == nullptr || clock_ == nullptr) {
        throw std::invalid_argument("PowerMonitor requires a source and a clock");
    }
    if (cache_ttl_.count() <= 0.0) {
        throw std::invalid_argument("PowerMonitor cache_ttl must be positive");
    }
}

PowerStatus PowerMonitor::status() {
    std::scoped_lock lock(mutex_);
    if (!refreshed_at_ || clock_->now() - *refreshed_at_ >= to_steady(cache_ttl_)) {
        return refresh_locked();
    }
    return cached_;
}

PowerStatus PowerMonitor::refresh() {
    std::scoped_lock lock(mutex_);
    return refresh_locked();
}

PowerStatus PowerMonitor::refresh_locked() {
    try {
        cached_ = source_->read();
        refreshed_at_ = clock_->now();
        logger_->debug("Battery status refreshed: level={}%, charging={}", cached_.battery_percent, cached_.charging);
    } catch (const std::exception& exc) {
        logger_->warn(
            R"({{"component":"power_monitor","event":"read_failed","error":"{}","battery_percent":{},"charging":{}}})",
            exc.what(),
            cached_.battery_percent,
            cached_.charging
        );
    }
    return cached_;
}

}  // namespace transit_presence
