#include "transit_presence/consumer_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "transit_presence/errors.hpp"

namespace transit_presence {

ConsumerRegistry::ConsumerRegistry()
    : logger_(get_logger()) {}

bool ConsumerRegistry::request_updates(const std::string& consumer_id, Duration interval, LocationPriority priority) {
    if (consumer_id.empty()) {
        throw PresenceError(ErrorKind::ValidationError, "consumer id must not be empty");
    }
    if (interval.count() <= 0.0) {
        throw PresenceError(
            ErrorKind::ValidationError,
            fmt::format("consumer {} requested non-positive interval {}s", consumer_id, interval.count())
        );
    }

    std::scoped_lock lock(mutex_);
    const auto before = effective_demand_locked();
    map_consumers_[consumer_id] = ConsumerRequest{interval, priority};
    const auto after = effective_demand_locked();
    const bool changed = before != after;
    logger_->debug(
        R"({{"component":"consumer_registry","event":"request","consumer":"{}","interval_s":{},"priority":"{}","consumers":{},"reconfigure":{}}})",
        consumer_id,
        interval.count(),
        priority_name(priority),
        map_consumers_.size(),
        changed
    );
    return changed;
}

bool ConsumerRegistry::release_updates(const std::string& consumer_id) {
    std::scoped_lock lock(mutex_);
    if (map_consumers_.erase(consumer_id) == 0) {
        logger_->warn("Release requested for unknown location consumer {}", consumer_id);
        return false;
    }
    logger_->debug(
        R"({{"component":"consumer_registry","event":"release","consumer":"{}","consumers":{}}})",
        consumer_id,
        map_consumers_.size()
    );
    return map_consumers_.empty();
}

std::optional<ConsumerDemand> ConsumerRegistry::effective_demand() const {
    std::scoped_lock lock(mutex_);
    return effective_demand_locked();
}

std::vector<std::string> ConsumerRegistry::active_consumers() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_consumers;
    list_consumers.reserve(map_consumers_.size());
    for (const auto& [consumer_id, request] : map_consumers_) {
        list_consumers.push_back(consumer_id);
    }
    return list_consumers;
}

bool ConsumerRegistry::is_active() const {
    std::scoped_lock lock(mutex_);
    return !map_consumers_.empty();
}

std::string ConsumerRegistry::debug_info() const {
    std::scoped_lock lock(mutex_);
    std::string str_info = fmt::format("consumers={}", map_consumers_.size());
    for (const auto& [consumer_id, request] : map_consumers_) {
        str_info += fmt::format(" [{} {}s {}]", consumer_id, request.interval.count(), priority_name(request.priority));
    }
    if (const auto demand = effective_demand_locked()) {
        str_info += fmt::format(" effective={}s/{}", demand->interval.count(), priority_name(demand->priority));
    }
    return str_info;
}

void ConsumerRegistry::force_stop() {
    std::scoped_lock lock(mutex_);
    logger_->warn("Force-stopping location updates; dropping {} consumers", map_consumers_.size());
    map_consumers_.clear();
}

ConsumerSnapshot ConsumerRegistry::snapshot() const {
    std::scoped_lock lock(mutex_);
    return map_consumers_;
}

void ConsumerRegistry::restore(ConsumerSnapshot snapshot) {
    std::scoped_lock lock(mutex_);
    map_consumers_ = std::move(snapshot);
}

std::optional<ConsumerDemand> ConsumerRegistry::effective_demand_locked() const {
    if (map_consumers_.empty()) {
        return std::nullopt;
    }
    ConsumerDemand demand{map_consumers_.begin()->second.interval, map_consumers_.begin()->second.priority};
    for (const auto& [consumer_id, request] : map_consumers_) {
        demand.interval = std::min(demand.interval, request.interval);
        demand.priority = std::max(demand.priority, request.priority);
    }
    return demand;
}

}  // namespace transit_presence
