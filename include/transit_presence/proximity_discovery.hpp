// === Proximity Discovery =====================================================
//
// Watches the counterpart partition of the current destination and raises one
// notification per counterpart the first time it comes within the alert
// radius. Listener registration is gated by the MonitoringStateMachine; every
// (re)subscription bumps a generation counter so callbacks from a torn-down
// listener are ignored.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "transit_presence/errors.hpp"
#include "transit_presence/lifetime_guard.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/monitoring_state_machine.hpp"
#include "transit_presence/presence_store.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief Tunables for discovery.
 */
struct DiscoveryConfig final {
    double radius_m{500.0};            /**< Alert radius around the local position. */
    bool notifications_enabled{true};  /**< Whether listeners are registered at all. */
    bool notify_same_role{false};      /**< Also watch participants in the local role. */
};

/**
 * @brief Raised once per counterpart per session when it enters the radius.
 */
struct ProximityNotification final {
    std::string participant_id{};                   /**< Counterpart id. */
    ParticipantRole role{ParticipantRole::Seeker};  /**< Counterpart role. */
    std::string destination{};                      /**< Shared destination. */
    GeodeticCoordinate position{};                  /**< Counterpart position. */
    double distance_m{};                            /**< Distance from the local position. */
};

/** @brief One participant currently present in a watched partition. */
struct DiscoveredParticipant final {
    std::string participant_id{};
    ParticipantRole role{ParticipantRole::Seeker};
    GeodeticCoordinate position{};
    std::optional<double> distance_m{};  /**< Empty until the local position is known. */
    bool within_radius{false};
};

/**
 * @brief What the discovered list shows: everyone in the watched partitions plus counts.
 */
struct DiscoverySnapshot final {
    std::vector<DiscoveredParticipant> participants{};
    std::size_t within_radius{};
    std::size_t notified{};
};

using NotificationSink = std::function<void(const ProximityNotification&)>;
using DiscoveryObserver = std::function<void(const DiscoverySnapshot&)>;

class ProximityDiscovery final {
  public:
    ProximityDiscovery(PresenceStorePtr store, ErrorSinkPtr error_sink, DiscoveryConfig config = {});
    ~ProximityDiscovery();

    ProximityDiscovery(const ProximityDiscovery&) = delete;
    ProximityDiscovery& operator=(const ProximityDiscovery&) = delete;

    void set_notification_sink(NotificationSink sink);
    void set_snapshot_observer(DiscoveryObserver observer);

    /**
     * @brief Begin watching the counterpart partition for @p identity.
     *
     * Returns false when the state machine rejects a duplicate request or the
     * subscription fails (StoreError reported, state reset).
     */
    bool start_monitoring(const SessionIdentity& identity, std::optional<GeodeticCoordinate> position = std::nullopt);

    /** @brief Tear down every listener. False when nothing was running. */
    bool stop_monitoring();

    /** @brief Re-subscribe for a new destination. No-op (false) when unchanged or stopped. */
    bool change_destination(const std::string& destination);

    /** @brief Re-subscribe for a new role. No-op (false) when unchanged or stopped. */
    bool change_role(ParticipantRole role);

    void update_location(const GeodeticCoordinate& position);

    /** @brief Change the alert radius. Non-positive values are rejected with a ValidationError. */
    bool set_radius_m(double radius_m);

    /** @brief Disabling tears listeners down; enabling re-subscribes with a fresh notified set. */
    void set_notifications_enabled(bool enabled);

    void set_notify_same_role(bool enabled);

    [[nodiscard]] DiscoverySnapshot snapshot() const;
    [[nodiscard]] MonitoringState monitoring_state() const;
    [[nodiscard]] std::set<std::string> notified() const;
    [[nodiscard]] std::uint64_t notifications_emitted() const;
    [[nodiscard]] double radius_m() const;
    /** @brief Live subscriptions held by this engine. */
    [[nodiscard]] std::size_t listener_count() const;

  private:
    using Children = std::vector<std::pair<std::string, PresenceRecord>>;

    /** @brief Subscribe to the watched partitions for @p generation. Lock not held. */
    bool subscribe_partitions(const SessionIdentity& identity, std::uint64_t generation, bool notify_same_role);
    void teardown(std::vector<SubscriptionHandle> handles);
    void resubscribe(bool clear_notified);
    void on_partition(std::uint64_t generation, const PartitionSnapshot& snapshot);
    void evaluate_locked(std::vector<ProximityNotification>& notifications);
    [[nodiscard]] DiscoverySnapshot snapshot_locked() const;
    void deliver(const std::vector<ProximityNotification>& notifications, const std::optional<DiscoverySnapshot>& view);

    // Held by every subscription callback; retired before teardown.
    LifetimeGuardPtr lifetime_{std::make_shared<LifetimeGuard>()};
    PresenceStorePtr store_;
    ErrorSinkPtr error_sink_;
    MonitoringStateMachine state_machine_;

    mutable std::mutex mutex_;
    DiscoveryConfig config_;
    std::optional<SessionIdentity> identity_;
    std::optional<GeodeticCoordinate> position_;
    std::uint64_t generation_{0};
    std::vector<SubscriptionHandle> list_handles_;
    std::map<std::string, Children> map_partitions_;
    std::set<std::string> set_notified_;
    std::uint64_t notifications_emitted_{0};
    NotificationSink notification_sink_;
    DiscoveryObserver snapshot_observer_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
