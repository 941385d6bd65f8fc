#include "transit_presence/proximity_discovery.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "transit_presence/geodesy.hpp"

namespace transit_presence {

ProximityDiscovery::ProximityDiscovery(PresenceStorePtr store, ErrorSinkPtr error_sink, DiscoveryConfig config)
    : store_(std::move(store)),
      error_sink_(std::move(error_sink)),
      config_(config),
      logger_(get_logger()) {
    if (store_ == nullptr || error_sink_ == nullptr) {
        throw std::invalid_argument("ProximityDiscovery requires a store and an error sink");
    }
    if (!(config_.radius_m > 0.0)) {
        throw std::invalid_argument("DiscoveryConfig.radius_m must be positive");
    }
}

ProximityDiscovery::~ProximityDiscovery() {
    lifetime_->retire();
    std::vector<SubscriptionHandle> handles;
    {
        std::scoped_lock lock(mutex_);
        ++generation_;
        handles.swap(list_handles_);
    }
    teardown(std::move(handles));
}

void ProximityDiscovery::set_notification_sink(NotificationSink sink) {
    std::scoped_lock lock(mutex_);
    notification_sink_ = std::move(sink);
}

void ProximityDiscovery::set_snapshot_observer(DiscoveryObserver observer) {
    std::scoped_lock lock(mutex_);
    snapshot_observer_ = std::move(observer);
}

bool ProximityDiscovery::start_monitoring(const SessionIdentity& identity, std::optional<GeodeticCoordinate> position) {
    if (!state_machine_.request_start(identity)) {
        return false;
    }

    std::vector<SubscriptionHandle> previous_handles;
    std::uint64_t generation = 0;
    bool enabled = false;
    bool notify_same_role = false;
    {
        std::scoped_lock lock(mutex_);
        previous_handles.swap(list_handles_);
        generation = ++generation_;
        identity_ = identity;
        if (position) {
            position_ = position;
        }
        set_notified_.clear();
        map_partitions_.clear();
        enabled = config_.notifications_enabled;
        notify_same_role = config_.notify_same_role;
    }
    teardown(std::move(previous_handles));

    if (enabled && !subscribe_partitions(identity, generation, notify_same_role)) {
        {
            std::scoped_lock lock(mutex_);
            if (generation == generation_) {
                identity_.reset();
                ++generation_;
            }
        }
        state_machine_.reset_state();
        return false;
    }

    const bool started = state_machine_.mark_started(identity);
    logger_->info(
        R"({{"component":"discovery","event":"monitoring_started","identity":"{}","watching":"{}","listening":{}}})",
        describe(identity),
        partition_path(opposite_role(identity.role), identity.destination),
        enabled
    );
    return started;
}

bool ProximityDiscovery::stop_monitoring() {
    if (!state_machine_.request_stop()) {
        return false;
    }
    std::vector<SubscriptionHandle> handles;
    DiscoverySnapshot view{};
    {
        std::scoped_lock lock(mutex_);
        handles.swap(list_handles_);
        ++generation_;
        identity_.reset();
        map_partitions_.clear();
        set_notified_.clear();
        view = snapshot_locked();
    }
    teardown(std::move(handles));
    state_machine_.mark_stopped();
    logger_->info(R"({{"component":"discovery","event":"monitoring_stopped"}})");
    deliver({}, view);
    return true;
}

bool ProximityDiscovery::change_destination(const std::string& destination) {
    SessionIdentity next{};
    {
        std::scoped_lock lock(mutex_);
        if (!identity_ || identity_->destination == destination) {
            return false;
        }
        next = *identity_;
    }
    next.destination = destination;
    return start_monitoring(next);
}

bool ProximityDiscovery::change_role(ParticipantRole role) {
    SessionIdentity next{};
    {
        std::scoped_lock lock(mutex_);
        if (!identity_ || identity_->role == role) {
            return false;
        }
        next = *identity_;
    }
    next.role = role;
    return start_monitoring(next);
}

void ProximityDiscovery::update_location(const GeodeticCoordinate& position) {
    std::vector<ProximityNotification> notifications;
    std::optional<DiscoverySnapshot> view;
    {
        std::scoped_lock lock(mutex_);
        position_ = position;
        if (!identity_) {
            return;
        }
        evaluate_locked(notifications);
        view = snapshot_locked();
    }
    deliver(notifications, view);
}

bool ProximityDiscovery::set_radius_m(double radius_m) {
    if (!(radius_m > 0.0)) {
        error_sink_->report(ErrorEvent{
            ErrorKind::ValidationError,
            fmt::format("alert radius must be positive, got {}", radius_m),
            "proximity_discovery"
        });
        return false;
    }
    std::vector<ProximityNotification> notifications;
    std::optional<DiscoverySnapshot> view;
    {
        std::scoped_lock lock(mutex_);
        config_.radius_m = radius_m;
        if (identity_) {
            evaluate_locked(notifications);
            view = snapshot_locked();
        }
    }
    logger_->info(R"({{"component":"discovery","event":"radius","radius_m":{}}})", radius_m);
    deliver(notifications, view);
    return true;
}

void ProximityDiscovery::set_notifications_enabled(bool enabled) {
    {
        std::scoped_lock lock(mutex_);
        if (config_.notifications_enabled == enabled) {
            return;
        }
        config_.notifications_enabled = enabled;
    }
    logger_->info(R"({{"component":"discovery","event":"notifications","enabled":{}}})", enabled);
    resubscribe(enabled);
}

void ProximityDiscovery::set_notify_same_role(bool enabled) {
    {
        std::scoped_lock lock(mutex_);
        if (config_.notify_same_role == enabled) {
            return;
        }
        config_.notify_same_role = enabled;
    }
    resubscribe(false);
}

DiscoverySnapshot ProximityDiscovery::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshot_locked();
}

MonitoringState ProximityDiscovery::monitoring_state() const {
    return state_machine_.current();
}

std::set<std::string> ProximityDiscovery::notified() const {
    std::scoped_lock lock(mutex_);
    return set_notified_;
}

std::uint64_t ProximityDiscovery::notifications_emitted() const {
    std::scoped_lock lock(mutex_);
    return notifications_emitted_;
}

double ProximityDiscovery::radius_m() const {
    std::scoped_lock lock(mutex_);
    return config_.radius_m;
}

std::size_t ProximityDiscovery::listener_count() const {
    std::scoped_lock lock(mutex_);
    return list_handles_.size();
}

bool ProximityDiscovery::subscribe_partitions(
    const SessionIdentity& identity,
    std::uint64_t generation,
    bool notify_same_role
) {
    std::vector<std::string> list_paths{partition_path(opposite_role(identity.role), identity.destination)};
    if (notify_same_role) {
        list_paths.push_back(partition_path(identity.role, identity.destination));
    }

    std::vector<SubscriptionHandle> handles;
    try {
        for (const std::string& path : list_paths) {
            handles.push_back(store_->subscribe(path, [this, guard = lifetime_, generation](const PartitionSnapshot& snapshot) {
                guard->run_if_alive([&]() { on_partition(generation, snapshot); });
            }));
        }
    } catch (const std::exception& exc) {
        teardown(std::move(handles));
        logger_->error(
            R"({{"component":"discovery","event":"subscribe_failed","identity":"{}","error":"{}"}})",
            describe(identity),
            exc.what()
        );
        error_sink_->report(ErrorEvent{classify(std::current_exception()), exc.what(), list_paths.front()});
        return false;
    }

    bool superseded = false;
    {
        std::scoped_lock lock(mutex_);
        superseded = generation != generation_;
        if (!superseded) {
            list_handles_.insert(list_handles_.end(), handles.begin(), handles.end());
        }
    }
    if (superseded) {
        teardown(std::move(handles));
    }
    return true;
}

void ProximityDiscovery::teardown(std::vector<SubscriptionHandle> handles) {
    for (const SubscriptionHandle handle : handles) {
        store_->unsubscribe(handle);
    }
}

void ProximityDiscovery::resubscribe(bool clear_notified) {
    std::optional<SessionIdentity> identity;
    std::vector<SubscriptionHandle> previous_handles;
    std::uint64_t generation = 0;
    bool enabled = false;
    bool notify_same_role = false;
    DiscoverySnapshot view{};
    {
        std::scoped_lock lock(mutex_);
        if (!identity_) {
            return;
        }
        identity = identity_;
        previous_handles.swap(list_handles_);
        generation = ++generation_;
        map_partitions_.clear();
        if (clear_notified) {
            set_notified_.clear();
        }
        enabled = config_.notifications_enabled;
        notify_same_role = config_.notify_same_role;
        view = snapshot_locked();
    }
    teardown(std::move(previous_handles));
    deliver({}, view);

    if (enabled && !subscribe_partitions(*identity, generation, notify_same_role)) {
        {
            std::scoped_lock lock(mutex_);
            if (generation == generation_) {
                identity_.reset();
                ++generation_;
            }
        }
        state_machine_.reset_state();
    }
}

void ProximityDiscovery::on_partition(std::uint64_t generation, const PartitionSnapshot& snapshot) {
    std::vector<ProximityNotification> notifications;
    std::optional<DiscoverySnapshot> view;
    {
        std::scoped_lock lock(mutex_);
        if (generation != generation_) {
            logger_->debug("Ignoring stale update for {} (generation {})", snapshot.path, generation);
            return;
        }
        map_partitions_[snapshot.path] = snapshot.children;
        evaluate_locked(notifications);
        view = snapshot_locked();
    }
    deliver(notifications, view);
}

void ProximityDiscovery::evaluate_locked(std::vector<ProximityNotification>& notifications) {
    if (!identity_ || !position_ || !config_.notifications_enabled) {
        return;
    }
    for (const auto& [path, children] : map_partitions_) {
        for (const auto& [participant_id, record] : children) {
            if (participant_id == identity_->participant_id || set_notified_.count(participant_id) > 0) {
                continue;
            }
            const double distance_m = haversine_distance_m(*position_, record.position());
            if (distance_m > config_.radius_m) {
                continue;
            }
            set_notified_.insert(participant_id);
            ++notifications_emitted_;
            notifications.push_back(ProximityNotification{
                participant_id,
                record.role,
                record.destination,
                record.position(),
                distance_m
            });
            logger_->info(
                R"({{"component":"discovery","event":"proximity","counterpart":"{}","role":"{}","distance_m":{:.1f}}})",
                participant_id,
                role_name(record.role),
                distance_m
            );
        }
    }
}

DiscoverySnapshot ProximityDiscovery::snapshot_locked() const {
    DiscoverySnapshot view{};
    view.notified = set_notified_.size();
    for (const auto& [path, children] : map_partitions_) {
        for (const auto& [participant_id, record] : children) {
            if (identity_ && participant_id == identity_->participant_id) {
                continue;
            }
            DiscoveredParticipant participant{};
            participant.participant_id = participant_id;
            participant.role = record.role;
            participant.position = record.position();
            if (position_) {
                participant.distance_m = haversine_distance_m(*position_, record.position());
                participant.within_radius = *participant.distance_m <= config_.radius_m;
            }
            if (participant.within_radius) {
                ++view.within_radius;
            }
            view.participants.push_back(std::move(participant));
        }
    }
    return view;
}

void ProximityDiscovery::deliver(
    const std::vector<ProximityNotification>& notifications,
    const std::optional<DiscoverySnapshot>& view
) {
    NotificationSink sink;
    DiscoveryObserver observer;
    {
        std::scoped_lock lock(mutex_);
        sink = notification_sink_;
        observer = snapshot_observer_;
    }
    if (sink) {
        for (const ProximityNotification& notification : notifications) {
            sink(notification);
        }
    }
    if (observer && view) {
        observer(*view);
    }
}

}  // namespace transit_presence
