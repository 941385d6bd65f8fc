// === Consumer Registry =======================================================
//
// Reference-counted bookkeeping of every internal component that wants
// location updates. The registry owns no provider; it only tells its caller
// whether the single physical subscription has to be started, reconfigured or
// stopped after each change.

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transit_presence/logging.hpp"
#include "transit_presence/sampling_policy.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief Parameters requested by one consumer.
 */
struct ConsumerRequest final {
    Duration interval{};                                      /**< Requested fix cadence. */
    LocationPriority priority{LocationPriority::HighAccuracy};/**< Requested accuracy. */

    bool operator==(const ConsumerRequest&) const = default;
};

using ConsumerSnapshot = std::map<std::string, ConsumerRequest>;

/**
 * @brief Thread-safe consumer map with merged-demand computation.
 */
class ConsumerRegistry final {
  public:
    ConsumerRegistry();

    /**
     * @brief Register or update a consumer.
     *
     * @return true when the merged demand changed, i.e. the physical
     *         subscription must be started or reconfigured.
     * @throws PresenceError (ValidationError) for an empty id or a non-positive interval.
     */
    bool request_updates(const std::string& consumer_id, Duration interval, LocationPriority priority);

    /**
     * @brief Remove a consumer.
     *
     * @return true only when it was the last one and updates must stop.
     */
    bool release_updates(const std::string& consumer_id);

    /** @brief Shortest interval and most accurate priority, or empty without consumers. */
    [[nodiscard]] std::optional<ConsumerDemand> effective_demand() const;
    [[nodiscard]] std::vector<std::string> active_consumers() const;
    [[nodiscard]] bool is_active() const;
    [[nodiscard]] std::string debug_info() const;

    /** @brief Drop every consumer (error recovery). */
    void force_stop();

    [[nodiscard]] ConsumerSnapshot snapshot() const;
    /** @brief Roll back to a previously captured snapshot. */
    void restore(ConsumerSnapshot snapshot);

  private:
    [[nodiscard]] std::optional<ConsumerDemand> effective_demand_locked() const;

    mutable std::mutex mutex_;
    ConsumerSnapshot map_consumers_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
