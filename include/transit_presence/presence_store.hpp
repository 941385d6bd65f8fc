// === Presence Store ==========================================================
//
// Client-side view of the real-time directory. Records live at
// `{role}s/{destination}/{participant_id}`; callers subscribe to a partition
// (`{role}s/{destination}`) and receive a full snapshot of its children on
// every change. Mutating operations and reads are awaitable through
// `std::future`; failures surface as `StoreError` from `future::get()`.

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "transit_presence/types.hpp"

namespace transit_presence {

/** @brief Children of one partition at the moment of a change. */
struct PartitionSnapshot final {
    std::string path{};                                             /**< Partition path that changed. */
    std::vector<std::pair<std::string, PresenceRecord>> children{}; /**< Child key and value, key order. */
};

using ChangeCallback = std::function<void(const PartitionSnapshot&)>;
using SubscriptionHandle = std::uint64_t;

/** @brief Handle value never returned for a live subscription. */
inline constexpr SubscriptionHandle k_invalid_subscription{0};

/**
 * @brief Abstract connection to the presence directory.
 */
class PresenceStore {
  public:
    virtual ~PresenceStore() = default;

    /** @brief Replace the value at @p path; the store assigns the server timestamp. */
    virtual std::future<void> write(const std::string& path, const PresenceRecord& value) = 0;
    /** @brief Delete the value at @p path; deleting a missing path succeeds. */
    virtual std::future<void> remove(const std::string& path) = 0;
    /** @brief Ask the server to delete @p path if this connection drops ungracefully. */
    virtual std::future<void> on_disconnect_remove(const std::string& path) = 0;
    /** @brief One-shot read of a single record. */
    virtual std::future<std::optional<PresenceRecord>> read(const std::string& path) = 0;

    /**
     * @brief Watch every child of the partition at @p path.
     *
     * The current contents are delivered once right after subscribing, then
     * after every change. Throws StoreError when the subscription is refused.
     */
    virtual SubscriptionHandle subscribe(const std::string& path, ChangeCallback on_change) = 0;
    /** @brief Stop a subscription; unknown handles are ignored. */
    virtual void unsubscribe(SubscriptionHandle handle) = 0;
};

using PresenceStorePtr = std::shared_ptr<PresenceStore>;

}  // namespace transit_presence
