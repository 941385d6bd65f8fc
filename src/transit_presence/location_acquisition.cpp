#include "transit_presence/location_acquisition.hpp"

#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "transit_presence/geodesy.hpp"

namespace transit_presence {

LocationAcquisition::LocationAcquisition(
    LocationProviderPtr provider,
    PowerStatusSourcePtr power_source,
    SchedulerPtr clock,
    ErrorSinkPtr error_sink,
    AcquisitionConfig config
)
    : provider_(std::move(provider)),
      power_monitor_(std::move(power_source), std::move(clock), config.power_cache_ttl),
      error_sink_(std::move(error_sink)),
      config_(config),
      logger_(get_logger()) {
    if (provider_ == nullptr) {
        throw std::invalid_argument("LocationAcquisition requires a provider");
    }
    if (error_sink_ == nullptr) {
        throw std::invalid_argument("LocationAcquisition requires an error sink");
    }
    validate(config_.policy);
}

LocationAcquisition::~LocationAcquisition() {
    lifetime_->retire();
    std::scoped_lock lock(apply_mutex_);
    stop_provider_locked();
}

bool LocationAcquisition::request_updates(const std::string& consumer_id, Duration interval, LocationPriority priority) {
    std::scoped_lock lock(apply_mutex_);
    if (!provider_->permission_granted()) {
        report(ErrorKind::PermissionDenied, fmt::format("location permission missing for consumer {}", consumer_id));
        return false;
    }

    const ConsumerSnapshot previous = registry_.snapshot();
    bool changed = false;
    try {
        changed = registry_.request_updates(consumer_id, interval, priority);
    } catch (const PresenceError& exc) {
        report(exc.kind(), exc.what());
        return false;
    }

    if (!changed) {
        return false;
    }
    const ApplyOutcome outcome = apply_locked();
    if (outcome == ApplyOutcome::Failed) {
        registry_.restore(previous);
        return false;
    }
    if (outcome != ApplyOutcome::Started) {
        return false;
    }
    logger_->info(
        R"({{"component":"acquisition","event":"request","consumer":"{}","state":"{}"}})",
        consumer_id,
        registry_.debug_info()
    );
    return true;
}

bool LocationAcquisition::release_updates(const std::string& consumer_id) {
    std::scoped_lock lock(apply_mutex_);
    const auto demand_before = registry_.effective_demand();
    const bool last = registry_.release_updates(consumer_id);
    if (last) {
        stop_provider_locked();
        logger_->info(R"({{"component":"acquisition","event":"stopped","consumer":"{}"}})", consumer_id);
        return true;
    }
    if (registry_.effective_demand() != demand_before) {
        apply_locked();
    }
    return false;
}

void LocationAcquisition::set_foreground(bool foreground) {
    std::scoped_lock lock(apply_mutex_);
    if (foreground_ == foreground) {
        return;
    }
    foreground_ = foreground;
    logger_->info(R"({{"component":"acquisition","event":"lifecycle","foreground":{}}})", foreground);
    if (registry_.is_active()) {
        apply_locked();
    }
}

void LocationAcquisition::refresh_power_status() {
    std::scoped_lock lock(apply_mutex_);
    power_monitor_.refresh();
    if (registry_.is_active()) {
        apply_locked();
    }
}

ListenerId LocationAcquisition::add_fix_listener(FixListener listener) {
    if (!listener) {
        throw std::invalid_argument("LocationAcquisition fix listener must be callable");
    }
    std::scoped_lock lock(state_mutex_);
    const ListenerId listener_id = next_listener_++;
    map_listeners_.emplace(listener_id, std::move(listener));
    return listener_id;
}

void LocationAcquisition::remove_fix_listener(ListenerId listener_id) {
    std::scoped_lock lock(state_mutex_);
    map_listeners_.erase(listener_id);
}

std::optional<GeodeticCoordinate> LocationAcquisition::current_position() const {
    std::scoped_lock lock(state_mutex_);
    return last_accepted_;
}

bool LocationAcquisition::is_updating() const {
    std::scoped_lock lock(state_mutex_);
    return active_parameters_.has_value();
}

std::optional<SamplingParameters> LocationAcquisition::active_parameters() const {
    std::scoped_lock lock(state_mutex_);
    return active_parameters_;
}

bool LocationAcquisition::is_foreground() const {
    std::scoped_lock lock(apply_mutex_);
    return foreground_;
}

std::uint64_t LocationAcquisition::fixes_accepted() const {
    std::scoped_lock lock(state_mutex_);
    return fixes_accepted_;
}

std::uint64_t LocationAcquisition::fixes_dropped() const {
    std::scoped_lock lock(state_mutex_);
    return fixes_dropped_;
}

std::optional<GeodeticCoordinate> LocationAcquisition::last_known() {
    try {
        return provider_->last_known();
    } catch (const std::exception& exc) {
        logger_->warn("Last known location unavailable: {}", exc.what());
        return std::nullopt;
    }
}

const ConsumerRegistry& LocationAcquisition::consumers() const noexcept {
    return registry_;
}

LocationAcquisition::ApplyOutcome LocationAcquisition::apply_locked() {
    const auto demand = registry_.effective_demand();
    if (!demand) {
        stop_provider_locked();
        return ApplyOutcome::Stopped;
    }

    if (!foreground_ && !provider_->background_permission_granted()) {
        if (is_updating()) {
            logger_->info(
                R"({{"component":"acquisition","event":"suspended","reason":"no_background_permission","consumers":{}}})",
                registry_.active_consumers().size()
            );
        }
        stop_provider_locked();
        return ApplyOutcome::Stopped;
    }

    const DeviceContext context{foreground_, power_monitor_.status()};
    const SamplingParameters parameters = select_sampling_parameters(*demand, context, config_.policy);
    if (active_parameters() == parameters) {
        return ApplyOutcome::Unchanged;
    }

    try {
        provider_->start(parameters, [this, guard = lifetime_](const LocationFix& fix) {
            guard->run_if_alive([&]() { handle_fix(fix); });
        });
    } catch (const PresenceError& exc) {
        logger_->error(R"({{"component":"acquisition","event":"start_failed","error":"{}"}})", exc.what());
        report(exc.kind() == ErrorKind::PermissionDenied ? ErrorKind::PermissionDenied : ErrorKind::LocationError, exc.what());
        return ApplyOutcome::Failed;
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"acquisition","event":"start_failed","error":"{}"}})", exc.what());
        report(ErrorKind::LocationError, exc.what());
        return ApplyOutcome::Failed;
    }

    {
        std::scoped_lock lock(state_mutex_);
        active_parameters_ = parameters;
    }
    logger_->info(
        R"({{"component":"acquisition","event":"configured","mode":"{}","priority":"{}","interval_s":{},"min_interval_s":{},"min_displacement_m":{}}})",
        sampling_mode_name(select_sampling_mode(context, config_.policy)),
        priority_name(parameters.priority),
        parameters.interval.count(),
        parameters.min_interval.count(),
        parameters.min_displacement_m
    );
    return ApplyOutcome::Started;
}

void LocationAcquisition::stop_provider_locked() {
    {
        std::scoped_lock lock(state_mutex_);
        if (!active_parameters_) {
            return;
        }
        active_parameters_.reset();
    }
    try {
        provider_->stop();
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"acquisition","event":"stop_failed","error":"{}"}})", exc.what());
        report(ErrorKind::LocationError, exc.what());
    }
}

void LocationAcquisition::handle_fix(const LocationFix& fix) {
    std::vector<FixListener> list_listeners;
    {
        std::scoped_lock lock(state_mutex_);
        if (!active_parameters_) {
            return;
        }
        if (last_accepted_) {
            const double moved_m = haversine_distance_m(*last_accepted_, fix.position);
            if (moved_m < active_parameters_->min_displacement_m) {
                ++fixes_dropped_;
                logger_->trace("Dropped fix {:.1f} m from last accepted", moved_m);
                return;
            }
        }
        last_accepted_ = fix.position;
        ++fixes_accepted_;
        list_listeners.reserve(map_listeners_.size());
        for (const auto& [listener_id, listener] : map_listeners_) {
            list_listeners.push_back(listener);
        }
    }
    for (const FixListener& listener : list_listeners) {
        listener(fix);
    }
}

void LocationAcquisition::report(ErrorKind kind, const std::string& message) {
    error_sink_->report(ErrorEvent{kind, message, "location_acquisition"});
}

}  // namespace transit_presence
