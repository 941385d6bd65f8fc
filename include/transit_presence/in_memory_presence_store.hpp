// === In-Memory Presence Store ================================================
//
// In-process stand-in for the real-time directory backend, used by the
// simulator and the test suite. One `InMemoryPresenceStore` plays the server;
// `connect()` hands out per-connection `PresenceStore` clients so that
// disconnect hooks can be attributed to the connection that registered them.
// Change notifications are delivered asynchronously through a Scheduler, the
// way a real backend calls back on its own thread.

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "transit_presence/errors.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/presence_store.hpp"
#include "transit_presence/scheduler.hpp"

namespace transit_presence {

/** @brief Kinds of operation a client can issue, used for history and failure injection. */
enum class StoreOperation {
    Write,
    Remove,
    RegisterDisconnectHook,
    Read,
    Subscribe
};

/** @brief One applied mutation, recorded in server order. */
struct StoreEvent final {
    StoreOperation operation{StoreOperation::Write}; /**< Operation that was applied. */
    std::string path{};                              /**< Target path. */
    std::string connection_id{};                     /**< Issuing connection, or "server" for hooks. */
    std::size_t record_count_after{};                /**< Total records once applied. */
};

/**
 * @brief Thread-safe in-process directory server.
 */
class InMemoryPresenceStore final : public std::enable_shared_from_this<InMemoryPresenceStore> {
  private:
    /** Restricts construction to create(). */
    struct ConstructionTag final {
        explicit ConstructionTag() = default;
    };

  public:
    /**
     * @brief Create a server that delivers change callbacks on @p delivery_scheduler.
     */
    static std::shared_ptr<InMemoryPresenceStore> create(SchedulerPtr delivery_scheduler);

    /** @brief Open (or reopen) a client connection. */
    PresenceStorePtr connect(const std::string& connection_id);

    /**
     * @brief Drop a connection ungracefully.
     *
     * Fires every disconnect hook it registered, cancels its subscriptions,
     * and fails its later operations with a network error until reconnected.
     */
    void disconnect(const std::string& connection_id);

    /** @brief Make the next @p count operations of @p operation on @p connection_id fail. */
    void inject_failures(const std::string& connection_id, StoreOperation operation, int count, StoreError::Cause cause);

    /** @brief Refuse every operation from @p connection_id (authorization revoked) until cleared. */
    void set_authorization_revoked(const std::string& connection_id, bool revoked);

    [[nodiscard]] std::optional<PresenceRecord> get(const std::string& path) const;
    [[nodiscard]] std::vector<std::string> paths() const;
    /** @brief Every path whose final segment is @p participant_id. */
    [[nodiscard]] std::vector<std::string> paths_for(const std::string& participant_id) const;
    [[nodiscard]] std::size_t record_count() const;
    [[nodiscard]] std::size_t listener_count() const;
    [[nodiscard]] std::size_t listener_count(const std::string& partition_path) const;
    [[nodiscard]] std::size_t disconnect_hook_count(const std::string& connection_id) const;
    [[nodiscard]] std::vector<StoreEvent> history() const;

    /** @brief Invoked synchronously after every applied mutation. */
    void set_mutation_observer(std::function<void(const StoreEvent&)> observer);

    InMemoryPresenceStore(ConstructionTag, SchedulerPtr delivery_scheduler);

  private:
    friend class InMemoryStoreClient;

    struct Subscription final {
        std::string connection_id{};
        std::string path{};
        ChangeCallback callback{};
    };

    struct FailurePlan final {
        int remaining{};
        StoreError::Cause cause{StoreError::Cause::Network};
    };

    struct PendingDelivery final {
        SubscriptionHandle handle{};
        PartitionSnapshot snapshot{};
    };


    void apply_write(const std::string& connection_id, const std::string& path, const PresenceRecord& value);
    void apply_remove(const std::string& connection_id, const std::string& path);
    void register_hook(const std::string& connection_id, const std::string& path);
    std::optional<PresenceRecord> apply_read(const std::string& connection_id, const std::string& path);
    SubscriptionHandle add_subscription(const std::string& connection_id, const std::string& path, ChangeCallback callback);
    void remove_subscription(SubscriptionHandle handle);

    /** @brief Throws StoreError if the connection is offline, revoked, or has a planned failure. Lock held. */
    void check_operation_locked(const std::string& connection_id, StoreOperation operation);
    void record_mutation_locked(StoreOperation operation, const std::string& path, const std::string& connection_id);
    void erase_record_locked(const std::string& path, std::vector<PendingDelivery>& deliveries);
    void collect_deliveries_locked(const std::string& record_path, std::vector<PendingDelivery>& deliveries) const;
    [[nodiscard]] PartitionSnapshot snapshot_locked(const std::string& partition) const;
    void dispatch(std::vector<PendingDelivery> deliveries);
    void notify_observer(const std::vector<StoreEvent>& events);

    SchedulerPtr delivery_scheduler_;
    mutable std::mutex mutex_;
    std::map<std::string, PresenceRecord> map_records_;
    std::map<SubscriptionHandle, Subscription> map_subscriptions_;
    SubscriptionHandle next_subscription_{1};
    std::unordered_map<std::string, std::set<std::string>> map_disconnect_hooks_;
    std::set<std::string> set_offline_connections_;
    std::set<std::string> set_revoked_connections_;
    std::map<std::pair<std::string, StoreOperation>, FailurePlan> map_failure_plans_;
    std::vector<StoreEvent> list_history_;
    std::function<void(const StoreEvent&)> mutation_observer_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief One connection to an InMemoryPresenceStore.
 */
class InMemoryStoreClient final : public PresenceStore {
  public:
    InMemoryStoreClient(std::shared_ptr<InMemoryPresenceStore> server, std::string connection_id);

    std::future<void> write(const std::string& path, const PresenceRecord& value) override;
    std::future<void> remove(const std::string& path) override;
    std::future<void> on_disconnect_remove(const std::string& path) override;
    std::future<std::optional<PresenceRecord>> read(const std::string& path) override;
    SubscriptionHandle subscribe(const std::string& path, ChangeCallback on_change) override;
    void unsubscribe(SubscriptionHandle handle) override;

    [[nodiscard]] const std::string& connection_id() const noexcept;

  private:
    std::shared_ptr<InMemoryPresenceStore> server_;
    std::string str_connection_id_;
};

}  // namespace transit_presence
