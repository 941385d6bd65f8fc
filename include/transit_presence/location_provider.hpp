// === Location Provider =======================================================
//
// Seam between the acquisition layer and the platform's fused location
// service. Only `LocationAcquisition` talks to a provider. The simulated
// implementation records every request and lets the simulator and tests push
// fixes and toggle permissions.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "transit_presence/logging.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief Configuration handed to the platform provider for one subscription.
 */
struct SamplingParameters final {
    Duration interval{};                                     /**< Desired fix cadence. */
    Duration min_interval{};                                 /**< Fastest cadence accepted. */
    LocationPriority priority{LocationPriority::HighAccuracy};/**< Accuracy/power trade-off. */
    double min_displacement_m{};                             /**< Smallest movement reported. */

    bool operator==(const SamplingParameters&) const = default;
};

using FixCallback = std::function<void(const LocationFix&)>;

/**
 * @brief Abstract platform location service.
 */
class LocationProvider {
  public:
    virtual ~LocationProvider() = default;

    /**
     * @brief Begin (or atomically replace) the single location request.
     *
     * Throws PresenceError on platform failure.
     */
    virtual void start(const SamplingParameters& parameters, FixCallback on_fix) = 0;
    /** @brief Cancel the running request; no-op when idle. */
    virtual void stop() = 0;
    /** @brief One-shot cached fix, if the platform has one. */
    [[nodiscard]] virtual std::optional<GeodeticCoordinate> last_known() = 0;
    [[nodiscard]] virtual bool permission_granted() const = 0;
    [[nodiscard]] virtual bool background_permission_granted() const = 0;
};

using LocationProviderPtr = std::shared_ptr<LocationProvider>;

/**
 * @brief Scriptable provider used by the simulator and the tests.
 */
class SimulatedLocationProvider final : public LocationProvider {
  public:
    SimulatedLocationProvider();

    void start(const SamplingParameters& parameters, FixCallback on_fix) override;
    void stop() override;
    [[nodiscard]] std::optional<GeodeticCoordinate> last_known() override;
    [[nodiscard]] bool permission_granted() const override;
    [[nodiscard]] bool background_permission_granted() const override;

    /**
     * @brief Deliver a fix to the running request.
     *
     * Returns false when no request is running. The fix also becomes the
     * cached `last_known()` value either way.
     */
    bool emit(const GeodeticCoordinate& position, double accuracy_m = 5.0);

    void set_permission(bool granted);
    void set_background_permission(bool granted);
    void set_last_known(std::optional<GeodeticCoordinate> position);
    /** @brief Make the next @p count calls to start() throw. */
    void fail_next_starts(int count);

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::optional<SamplingParameters> active_parameters() const;
    [[nodiscard]] int start_calls() const;
    [[nodiscard]] int stop_calls() const;
    [[nodiscard]] std::vector<SamplingParameters> start_history() const;

  private:
    mutable std::mutex mutex_;
    FixCallback on_fix_;
    std::optional<SamplingParameters> active_parameters_;
    std::optional<GeodeticCoordinate> last_known_;
    std::vector<SamplingParameters> list_start_history_;
    bool permission_granted_{true};
    bool background_permission_granted_{true};
    int pending_start_failures_{0};
    int stop_calls_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
