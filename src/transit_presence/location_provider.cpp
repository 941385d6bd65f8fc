#include "transit_presence/location_provider.hpp"

#include "transit_presence/errors.hpp"

namespace transit_presence {

SimulatedLocationProvider::SimulatedLocationProvider()
    : logger_(get_logger()) {}

void SimulatedLocationProvider::start(const SamplingParameters& parameters, FixCallback on_fix) {
    std::scoped_lock lock(mutex_);
    list_start_history_.push_back(parameters);
    if (!permission_granted_) {
        throw PresenceError(ErrorKind::PermissionDenied, "location permission not granted");
    }
    if (pending_start_failures_ > 0) {
        --pending_start_failures_;
        throw PresenceError(ErrorKind::LocationError, "simulated provider failed to start");
    }
    on_fix_ = std::move(on_fix);
    active_parameters_ = parameters;
    logger_->debug(
        "Simulated provider started: priority={} interval={}s displacement={}m",
        priority_name(parameters.priority),
        parameters.interval.count(),
        parameters.min_displacement_m
    );
}

void SimulatedLocationProvider::stop() {
    std::scoped_lock lock(mutex_);
    ++stop_calls_;
    on_fix_ = nullptr;
    active_parameters_.reset();
}

std::optional<GeodeticCoordinate> SimulatedLocationProvider::last_known() {
    std::scoped_lock lock(mutex_);
    return last_known_;
}

bool SimulatedLocationProvider::permission_granted() const {
    std::scoped_lock lock(mutex_);
    return permission_granted_;
}

bool SimulatedLocationProvider::background_permission_granted() const {
    std::scoped_lock lock(mutex_);
    return background_permission_granted_;
}

bool SimulatedLocationProvider::emit(const GeodeticCoordinate& position, double accuracy_m) {
    FixCallback callback;
    {
        std::scoped_lock lock(mutex_);
        last_known_ = position;
        callback = on_fix_;
    }
    if (!callback) {
        return false;
    }
    callback(LocationFix{position, accuracy_m, SteadyClock::now()});
    return true;
}

void SimulatedLocationProvider::set_permission(bool granted) {
    std::scoped_lock lock(mutex_);
    permission_granted_ = granted;
}

void SimulatedLocationProvider::set_background_permission(bool granted) {
    std::scoped_lock lock(mutex_);
    background_permission_granted_ = granted;
}

void SimulatedLocationProvider::set_last_known(std::optional<GeodeticCoordinate> position) {
    std::scoped_lock lock(mutex_);
    last_known_ = position;
}

void SimulatedLocationProvider::fail_next_starts(int count) {
    std::scoped_lock lock(mutex_);
    pending_start_failures_ = count;
}

bool SimulatedLocationProvider::running() const {
    std::scoped_lock lock(mutex_);
    return active_parameters_.has_value();
}

std::optional<SamplingParameters> SimulatedLocationProvider::active_parameters() const {
    std::scoped_lock lock(mutex_);
    return active_parameters_;
}

int SimulatedLocationProvider::start_calls() const {
    std::scoped_lock lock(mutex_);
    return static_cast<int>(list_start_history_.size());
}

int SimulatedLocationProvider::stop_calls() const {
    std::scoped_lock lock(mutex_);
    return stop_calls_;
}

std::vector<SamplingParameters> SimulatedLocationProvider::start_history() const {
    std::scoped_lock lock(mutex_);
    return list_start_history_;
}

}  // namespace transit_presence
