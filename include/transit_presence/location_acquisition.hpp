// === Location Acquisition ====================================================
//
// Owns the single physical location subscription. Consumers register demand
// through the ConsumerRegistry; every change is diffed against the running
// provider configuration and applied only when the adaptive sampling
// parameters actually differ. Accepted fixes pass a displacement filter before
// reaching the registered fix listeners.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "transit_presence/consumer_registry.hpp"
#include "transit_presence/errors.hpp"
#include "transit_presence/lifetime_guard.hpp"
#include "transit_presence/location_provider.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/power_monitor.hpp"
#include "transit_presence/sampling_policy.hpp"
#include "transit_presence/scheduler.hpp"

namespace transit_presence {

/**
 * @brief Tunables for adaptive acquisition.
 */
struct AcquisitionConfig final {
    SamplingPolicyConfig policy{};  /**< Policy table values. */
    Duration power_cache_ttl{30.0}; /**< How long a battery reading stays fresh. */
};

using FixListener = std::function<void(const LocationFix&)>;
using ListenerId = std::uint64_t;

class LocationAcquisition final {
  public:
    LocationAcquisition(
        LocationProviderPtr provider,
        PowerStatusSourcePtr power_source,
        SchedulerPtr clock,
        ErrorSinkPtr error_sink,
        AcquisitionConfig config = {}
    );
    ~LocationAcquisition();

    LocationAcquisition(const LocationAcquisition&) = delete;
    LocationAcquisition& operator=(const LocationAcquisition&) = delete;

    /**
     * @brief Register or update a consumer and apply the resulting configuration.
     *
     * @return true when the provider was started or reconfigured. False when
     *         the selected sampling parameters did not change, when updates
     *         are suspended in the background, or when the request failed and
     *         was rolled back (PermissionDenied, LocationError or
     *         ValidationError reported).
     */
    bool request_updates(const std::string& consumer_id, Duration interval, LocationPriority priority);

    /**
     * @brief Remove a consumer. Returns true when it was the last and updates stopped.
     */
    bool release_updates(const std::string& consumer_id);

    /** @brief Re-evaluate the policy for a lifecycle transition. */
    void set_foreground(bool foreground);

    /** @brief Re-read the battery and re-evaluate the policy. */
    void refresh_power_status();

    ListenerId add_fix_listener(FixListener listener);
    void remove_fix_listener(ListenerId listener_id);

    /** @brief Position of the last accepted fix. */
    [[nodiscard]] std::optional<GeodeticCoordinate> current_position() const;
    [[nodiscard]] bool is_updating() const;
    [[nodiscard]] std::optional<SamplingParameters> active_parameters() const;
    [[nodiscard]] bool is_foreground() const;
    [[nodiscard]] std::uint64_t fixes_accepted() const;
    [[nodiscard]] std::uint64_t fixes_dropped() const;

    /** @brief One-shot cached platform fix. */
    [[nodiscard]] std::optional<GeodeticCoordinate> last_known();

    [[nodiscard]] const ConsumerRegistry& consumers() const noexcept;

  private:
    enum class ApplyOutcome {
        Unchanged,
        Started,
        Stopped,
        Failed
    };

    /** @brief Bring the provider in line with the registry. Apply mutex held. */
    ApplyOutcome apply_locked();
    void stop_provider_locked();
    void handle_fix(const LocationFix& fix);
    void report(ErrorKind kind, const std::string& message);

    LifetimeGuardPtr lifetime_{std::make_shared<LifetimeGuard>()};
    LocationProviderPtr provider_;
    PowerMonitor power_monitor_;
    ErrorSinkPtr error_sink_;
    AcquisitionConfig config_;
    ConsumerRegistry registry_;

    mutable std::mutex apply_mutex_;
    bool foreground_{true};

    mutable std::mutex state_mutex_;
    std::optional<SamplingParameters> active_parameters_;
    std::optional<GeodeticCoordinate> last_accepted_;
    std::uint64_t fixes_accepted_{0};
    std::uint64_t fixes_dropped_{0};
    std::map<ListenerId, FixListener> map_listeners_;
    ListenerId next_listener_{1};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
