#include "transit_presence/sampling_policy.hpp"

#include <algorithm>
#include <stdexcept>

namespace transit_presence {

namespace {

void require_positive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string("SamplingPolicyConfig.") + name + " must be positive");
    }
}

}  // namespace

void validate(const SamplingPolicyConfig& config) {
    require_positive(config.charging_min_interval.count(), "charging_min_interval");
    require_positive(config.charging_min_displacement_m, "charging_min_displacement_m");
    require_positive(config.low_battery_threshold_percent, "low_battery_threshold_percent");
    require_positive(config.low_battery_interval.count(), "low_battery_interval");
    require_positive(config.low_battery_min_interval.count(), "low_battery_min_interval");
    require_positive(config.low_battery_min_displacement_m, "low_battery_min_displacement_m");
    require_positive(config.background_interval.count(), "background_interval");
    require_positive(config.background_min_interval.count(), "background_min_interval");
    require_positive(config.background_min_displacement_m, "background_min_displacement_m");
    require_positive(config.foreground_min_interval.count(), "foreground_min_interval");
    require_positive(config.foreground_min_displacement_m, "foreground_min_displacement_m");
}

std::string_view sampling_mode_name(SamplingMode mode) noexcept {
    switch (mode) {
        case SamplingMode::Charging:
            return "charging";
        case SamplingMode::LowBatteryBackground:
            return "low_battery_background";
        case SamplingMode::Background:
            return "background";
        case SamplingMode::Foreground:
            return "foreground";
    }
    return "unknown";
}

SamplingMode select_sampling_mode(const DeviceContext& context, const SamplingPolicyConfig& config) noexcept {
    if (context.power.charging) {
        return SamplingMode::Charging;
    }
    if (!context.foreground && context.power.battery_percent < config.low_battery_threshold_percent) {
        return SamplingMode::LowBatteryBackground;
    }
    if (!context.foreground) {
        return SamplingMode::Background;
    }
    return SamplingMode::Foreground;
}

SamplingParameters select_sampling_parameters(
    const ConsumerDemand& demand,
    const DeviceContext& context,
    const SamplingPolicyConfig& config
) {
    SamplingParameters parameters{};
    switch (select_sampling_mode(context, config)) {
        case SamplingMode::Charging:
            parameters.priority = LocationPriority::HighAccuracy;
            parameters.interval = demand.interval;
            parameters.min_interval = config.charging_min_interval;
            parameters.min_displacement_m = config.charging_min_displacement_m;
            break;
        case SamplingMode::LowBatteryBackground:
            parameters.priority = LocationPriority::LowPower;
            parameters.interval = config.low_battery_interval;
            parameters.min_interval = config.low_battery_min_interval;
            parameters.min_displacement_m = config.low_battery_min_displacement_m;
            break;
        case SamplingMode::Background:
            parameters.priority = LocationPriority::Balanced;
            parameters.interval = config.background_interval;
            parameters.min_interval = config.background_min_interval;
            parameters.min_displacement_m = config.background_min_displacement_m;
            break;
        case SamplingMode::Foreground:
            parameters.priority = demand.priority;
            parameters.interval = demand.interval;
            parameters.min_interval = config.foreground_min_interval;
            parameters.min_displacement_m = config.foreground_min_displacement_m;
            break;
    }
    parameters.min_interval = std::min(parameters.min_interval, parameters.interval);
    return parameters;
}

}  // namespace transit_presence
