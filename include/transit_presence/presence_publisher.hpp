// === Presence Publisher ======================================================
//
// Turns accepted location fixes into directory writes for the current session
// identity. Fixes are debounced (time or distance), coalesced over a short
// settle delay, and retried with exponential backoff while the app is in the
// foreground. Every store mutation runs on the I/O scheduler and under one I/O
// mutex. The paths of earlier identities stay queued for removal until the
// store confirms them, and a write for the current identity is only issued
// once that queue is empty, so a participant never holds two records.

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "transit_presence/errors.hpp"
#include "transit_presence/lifetime_guard.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/presence_store.hpp"
#include "transit_presence/scheduler.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief Tunables for debounce, coalescing and retry.
 */
struct PublisherConfig final {
    Duration debounce_window{5.0};   /**< Minimum spacing of accepted writes without movement. */
    double min_distance_m{10.0};     /**< Movement that bypasses the debounce window. */
    Duration settle_delay{1.0};      /**< Coalescing delay before an accepted write is issued. */
    Duration retry_base_delay{0.5};  /**< First retry delay; doubles per attempt. */
    int max_retry_attempts{3};       /**< Retries after the initial attempt. */
    Duration store_timeout{10.0};    /**< Longest wait for one store acknowledgement. */
};

/**
 * @brief Throws std::invalid_argument when a tunable is out of range.
 */
void validate(const PublisherConfig& config);

class PresencePublisher final {
  public:
    PresencePublisher(PresenceStorePtr store, SchedulerPtr scheduler, ErrorSinkPtr error_sink, PublisherConfig config = {});
    ~PresencePublisher();

    PresencePublisher(const PresencePublisher&) = delete;
    PresencePublisher& operator=(const PresencePublisher&) = delete;

    /**
     * @brief Offer a fix for @p identity. Fire-and-forget.
     *
     * Ignored, with a ValidationError report, unless @p identity is the
     * current write target.
     */
    void publish(const SessionIdentity& identity, const GeodeticCoordinate& position);

    /**
     * @brief Switch the write target.
     *
     * Pending writes for the previous target are dropped and its path is
     * queued for removal. The returned future resolves once every queued path
     * is removed and the disconnect hook for the new path is registered; it
     * carries the StoreError of a failed first attempt. Failed removals are
     * retried with backoff, and writes for the new target wait until they
     * succeed.
     */
    std::future<void> set_identity(const SessionIdentity& identity);

    /**
     * @brief Cancel pending and retrying writes and delete the record of @p identity.
     *
     * Waits for an in-flight write to finish first, so the removal is the last
     * mutation for that path. Paths of earlier identities still queued for
     * removal are removed synchronously; the future fails when one of them
     * could not be. Clears the write target when it matches.
     */
    std::future<void> remove(const SessionIdentity& identity);

    /** @brief Cancel the settle timer and any scheduled retry. */
    void cancel_pending();

    void set_foreground(bool foreground);

    [[nodiscard]] std::optional<SessionIdentity> identity() const;
    [[nodiscard]] std::optional<GeodeticCoordinate> last_written_position() const;
    [[nodiscard]] std::uint64_t writes_issued() const;
    [[nodiscard]] bool has_pending_write() const;
    /** @brief Paths of earlier identities whose removal the store has not confirmed yet. */
    [[nodiscard]] std::set<std::string> stale_paths() const;

  private:
    void write_attempt(std::uint64_t generation, const SessionIdentity& identity, const GeodeticCoordinate& position, int attempt);
    void handle_write_failure(
        std::uint64_t generation,
        const SessionIdentity& identity,
        const GeodeticCoordinate& position,
        int attempt,
        std::exception_ptr error
    );
    /** @brief Flush queued removals and register the disconnect hook. @p completion is null on retries. */
    void apply_identity_change(const SessionIdentity& identity, int attempt, std::shared_ptr<std::promise<void>> completion);
    void schedule_identity_retry(const SessionIdentity& identity, int attempt, ErrorKind kind, const std::string& message);
    /** @brief Remove every queued stale path. I/O mutex held; throws on the first failure. */
    void flush_stale_paths();
    /** @brief Wait for a store acknowledgement, turning a timeout into a network StoreError. */
    void await_store(std::future<void> acknowledgement, const std::string& operation);
    void cancel_tasks_locked();
    void cancel_identity_retry_locked();
    void reset_debounce_locked();
    void report(ErrorKind kind, const std::string& message, const std::string& context);

    /** @brief Wrap @p body so it is skipped once this publisher is destroyed. */
    template <typename Body>
    Task guarded(Body body) {
        return [guard = lifetime_, body = std::move(body)]() { guard->run_if_alive(body); };
    }

    LifetimeGuardPtr lifetime_{std::make_shared<LifetimeGuard>()};
    PresenceStorePtr store_;
    SchedulerPtr scheduler_;
    ErrorSinkPtr error_sink_;
    PublisherConfig config_;

    /** Serializes every store mutation issued by this publisher. */
    std::mutex io_mutex_;

    mutable std::mutex mutex_;
    std::optional<SessionIdentity> target_;
    std::uint64_t generation_{0};
    bool foreground_{true};
    TaskId settle_task_{k_invalid_task};
    TaskId retry_task_{k_invalid_task};
    TaskId identity_retry_task_{k_invalid_task};
    std::set<std::string> set_stale_paths_;
    std::optional<TimePoint> last_accepted_at_;
    std::optional<GeodeticCoordinate> last_accepted_position_;
    std::optional<GeodeticCoordinate> last_written_position_;
    std::uint64_t writes_issued_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
