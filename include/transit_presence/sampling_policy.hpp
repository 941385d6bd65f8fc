// === Sampling Policy =========================================================
//
// Adaptive choice of the provider configuration from the merged consumer
// demand and the device context (foreground state, battery, charging). The
// policy is a pure function so it can be tested exhaustively and re-evaluated
// on every lifecycle or power change.

#pragma once

#include <optional>
#include <string>

#include "transit_presence/location_provider.hpp"
#include "transit_presence/power_monitor.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief Tunables of the sampling policy table.
 */
struct SamplingPolicyConfig final {
    Duration charging_min_interval{15.0};          /**< Fastest cadence while charging. */
    double charging_min_displacement_m{10.0};      /**< Displacement filter while charging. */
    double low_battery_threshold_percent{20.0};    /**< Battery level below which background sampling is throttled. */
    Duration low_battery_interval{600.0};          /**< Background cadence on low battery. */
    Duration low_battery_min_interval{600.0};      /**< Fastest background cadence on low battery. */
    double low_battery_min_displacement_m{100.0};  /**< Displacement filter on low battery. */
    Duration background_interval{300.0};           /**< Background cadence. */
    Duration background_min_interval{120.0};       /**< Fastest background cadence. */
    double background_min_displacement_m{50.0};    /**< Background displacement filter. */
    Duration foreground_min_interval{15.0};        /**< Fastest foreground cadence. */
    double foreground_min_displacement_m{20.0};    /**< Foreground displacement filter. */
};

/**
 * @brief Throws std::invalid_argument when any tunable is non-positive.
 */
void validate(const SamplingPolicyConfig& config);

/**
 * @brief Merged request of every registered consumer.
 */
struct ConsumerDemand final {
    Duration interval{};                                      /**< Shortest requested interval. */
    LocationPriority priority{LocationPriority::HighAccuracy};/**< Most accurate requested priority. */

    bool operator==(const ConsumerDemand&) const = default;
};

/**
 * @brief Device state the policy reacts to.
 */
struct DeviceContext final {
    bool foreground{true}; /**< Whether the app is visible. */
    PowerStatus power{};   /**< Latest cached power reading. */
};

/** @brief Which row of the policy table applied. */
enum class SamplingMode {
    Charging,
    LowBatteryBackground,
    Background,
    Foreground
};

std::string_view sampling_mode_name(SamplingMode mode) noexcept;

SamplingMode select_sampling_mode(const DeviceContext& context, const SamplingPolicyConfig& config) noexcept;

/**
 * @brief Compute the provider configuration for @p demand under @p context.
 *
 * The minimum interval never exceeds the chosen interval.
 */
SamplingParameters select_sampling_parameters(
    const ConsumerDemand& demand,
    const DeviceContext& context,
    const SamplingPolicyConfig& config
);

}  // namespace transit_presence
