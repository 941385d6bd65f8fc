// === Presence Session ========================================================
//
// Command surface used by the UI layer. A session composes location
// acquisition, presence publishing and proximity discovery for one
// participant: entering makes the participant visible and starts watching the
// counterpart partition, exiting releases location updates and removes the
// record. Observers receive a `SessionSnapshot` on the callback scheduler;
// store writes and their retries run on a separate I/O scheduler so a slow
// store never stalls the callback context.

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transit_presence/errors.hpp"
#include "transit_presence/location_acquisition.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/presence_publisher.hpp"
#include "transit_presence/presence_store.hpp"
#include "transit_presence/proximity_discovery.hpp"
#include "transit_presence/scheduler.hpp"

namespace transit_presence {

/**
 * @brief Session-level tunables.
 */
struct SessionConfig final {
    std::string consumer_id{"presence_session"};                       /**< Consumer slot held while in session. */
    Duration location_interval{15.0};                                  /**< Interval requested for the session consumer. */
    LocationPriority location_priority{LocationPriority::HighAccuracy};/**< Priority requested for the session consumer. */
    Duration teardown_timeout{5.0};                                    /**< Longest wait for removal on exit. */
};

/**
 * @brief Configuration of every component a session owns.
 */
struct PresenceSessionSettings final {
    SessionConfig session{};
    AcquisitionConfig acquisition{};
    PublisherConfig publisher{};
    DiscoveryConfig discovery{};
};

/** @brief What the UI shows about the local participant. */
enum class SessionAvailability {
    NotAvailable,
    Available,
    Error
};

std::string_view availability_name(SessionAvailability availability) noexcept;

struct SessionSnapshot final {
    SessionAvailability availability{SessionAvailability::NotAvailable};
    std::optional<SessionIdentity> identity{};
    std::optional<GeodeticCoordinate> current_position{};
    bool is_updating{false};
    DiscoverySnapshot discovered{};
    std::optional<ErrorEvent> last_error{};
};

using SessionObserver = std::function<void(const SessionSnapshot&)>;

class PresenceSession final {
  public:
    /**
     * @param callback_context  Observers, notifications and location bookkeeping run on it.
     * @param io_context        Publisher writes, removals and retries run on it. Blocking waits on
     *                          store acknowledgements happen here, never on @p callback_context.
     */
    PresenceSession(
        PresenceStorePtr store,
        LocationProviderPtr provider,
        PowerStatusSourcePtr power_source,
        SchedulerPtr callback_context,
        SchedulerPtr io_context,
        ErrorSinkPtr error_sink,
        PresenceSessionSettings settings = {}
    );
    ~PresenceSession();

    PresenceSession(const PresenceSession&) = delete;
    PresenceSession& operator=(const PresenceSession&) = delete;

    /**
     * @brief Become available as @p role heading to @p destination.
     *
     * Returns false when the request is invalid or the session is shut down.
     */
    bool enter_session(const std::string& participant_id, ParticipantRole role, const std::string& destination);

    /**
     * @brief Leave the session and remove the record.
     *
     * @return true when the store confirmed the removal within the teardown timeout.
     */
    bool exit_session();

    bool change_destination(const std::string& destination);
    bool change_role(ParticipantRole role);
    void set_foreground(bool foreground);

    /**
     * @brief Look for a record left behind by an earlier run.
     *
     * Reads the participant's path under every role and candidate
     * destination. More than one hit is an invariant violation: every
     * duplicate is removed and nothing is returned.
     */
    std::optional<SessionIdentity> recover_identity(
        const std::string& participant_id,
        const std::vector<std::string>& candidate_destinations
    );

    /** @brief Cancel timers and make a best-effort synchronous removal. Idempotent. */
    void shutdown();

    void set_observer(SessionObserver observer);
    void set_notification_sink(NotificationSink sink);

    [[nodiscard]] SessionSnapshot snapshot() const;

    [[nodiscard]] const LocationAcquisition& acquisition() const noexcept;
    [[nodiscard]] const PresencePublisher& publisher() const noexcept;
    [[nodiscard]] const ProximityDiscovery& discovery() const noexcept;

    /** @brief Forward one event to the downstream sink and track terminal failures. */
    class ErrorRelay final : public ErrorSink {
      public:
        ErrorRelay(PresenceSession& session, ErrorSinkPtr downstream);
        void report(const ErrorEvent& event) override;

      private:
        PresenceSession& session_;
        ErrorSinkPtr downstream_;
    };

  private:
    void on_fix(const LocationFix& fix);
    void on_error(const ErrorEvent& event);
    /** @brief Publish the freshest position known for @p identity: last fix, platform cache, then stored record. */
    void publish_best_position(const SessionIdentity& identity);
    void notify_observer();
    /** @brief Wait for a store acknowledgement up to the teardown timeout. Reports failures. */
    bool await_acknowledgement(std::future<void> acknowledgement, const std::string& context);

    PresenceStorePtr store_;
    SchedulerPtr callback_context_;
    SessionConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::optional<SessionIdentity> identity_;
    SessionAvailability availability_{SessionAvailability::NotAvailable};
    std::optional<ErrorEvent> last_error_;
    bool shut_down_{false};
    SessionObserver observer_;
    NotificationSink notification_sink_;

    // Components last: they report through the relay while being destroyed.
    std::shared_ptr<ErrorRelay> error_relay_;
    LocationAcquisition acquisition_;
    PresencePublisher publisher_;
    ProximityDiscovery discovery_;
    ListenerId fix_listener_{0};
};

}  // namespace transit_presence
