// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings. The
// loader transforms raw `TRANSIT_PRESENCE_*` variables into the strongly-typed
// `Configuration` structure consumed by the simulator and embedding apps.
//
// Responsibilities
// - Enforce defaults for every tunable (debounce, settle, retry caps, radii,
//   timeouts, sampling table).
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups.
//
// Note: nothing is read from disk; callers populate the process environment
// ahead of time (a shell-sourced `.env`, a launch configuration).

#include "transit_presence/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "transit_presence/logging.hpp"
#include "transit_presence/version.hpp"

namespace transit_presence {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{}={} is not positive; using fallback {}", name, raw_value, fallback);
        }
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

Duration parse_seconds(const char* name, Duration fallback) {
    return Duration{parse_double(name, fallback.count())};
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{}={} is not positive; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

bool parse_flag(const char* name, bool fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string_view text{raw_value};
    if (text == "1" || text == "true" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse flag from {}; using fallback {}", name, fallback);
    return fallback;
}

std::string parse_log_directory(const std::filesystem::path& config_root) {
    const char* raw_directory = std::getenv("TRANSIT_PRESENCE_LOG_DIR");
    const std::filesystem::path path_directory{
        raw_directory == nullptr || std::string_view{raw_directory}.empty() ? k_default_log_directory
                                                                             : std::string_view{raw_directory}
    };
    if (path_directory.is_absolute()) {
        return path_directory.string();
    }
    return (config_root / path_directory).string();
}

void load_policy(SamplingPolicyConfig& policy) {
    policy.charging_min_interval = parse_seconds("TRANSIT_PRESENCE_CHARGING_MIN_INTERVAL_S", policy.charging_min_interval);
    policy.charging_min_displacement_m =
        parse_double("TRANSIT_PRESENCE_CHARGING_MIN_DISPLACEMENT_M", policy.charging_min_displacement_m);
    policy.low_battery_threshold_percent =
        parse_double("TRANSIT_PRESENCE_LOW_BATTERY_PERCENT", policy.low_battery_threshold_percent);
    policy.low_battery_interval = parse_seconds("TRANSIT_PRESENCE_LOW_BATTERY_INTERVAL_S", policy.low_battery_interval);
    policy.low_battery_min_interval =
        parse_seconds("TRANSIT_PRESENCE_LOW_BATTERY_MIN_INTERVAL_S", policy.low_battery_min_interval);
    policy.low_battery_min_displacement_m =
        parse_double("TRANSIT_PRESENCE_LOW_BATTERY_MIN_DISPLACEMENT_M", policy.low_battery_min_displacement_m);
    policy.background_interval = parse_seconds("TRANSIT_PRESENCE_BACKGROUND_INTERVAL_S", policy.background_interval);
    policy.background_min_interval =
        parse_seconds("TRANSIT_PRESENCE_BACKGROUND_MIN_INTERVAL_S", policy.background_min_interval);
    policy.background_min_displacement_m =
        parse_double("TRANSIT_PRESENCE_BACKGROUND_MIN_DISPLACEMENT_M", policy.background_min_displacement_m);
    policy.foreground_min_interval =
        parse_seconds("TRANSIT_PRESENCE_FOREGROUND_MIN_INTERVAL_S", policy.foreground_min_interval);
    policy.foreground_min_displacement_m =
        parse_double("TRANSIT_PRESENCE_FOREGROUND_MIN_DISPLACEMENT_M", policy.foreground_min_displacement_m);
}

}  // namespace

PresenceSessionSettings Configuration::session_settings() const {
    return PresenceSessionSettings{session, acquisition, publisher, discovery};
}

Configuration ConfigurationLoader::load(const std::filesystem::path& config_root) {
    Configuration config{};
    config.log_directory = parse_log_directory(config_root);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading transit_presence {} configuration from environment", k_version);

    load_policy(config.acquisition.policy);
    config.acquisition.power_cache_ttl = parse_seconds("TRANSIT_PRESENCE_POWER_CACHE_TTL_S", config.acquisition.power_cache_ttl);

    PublisherConfig& publisher = config.publisher;
    publisher.debounce_window = parse_seconds("TRANSIT_PRESENCE_DEBOUNCE_S", publisher.debounce_window);
    publisher.min_distance_m = parse_double("TRANSIT_PRESENCE_MIN_DISTANCE_M", publisher.min_distance_m);
    publisher.settle_delay = parse_seconds("TRANSIT_PRESENCE_SETTLE_DELAY_S", publisher.settle_delay);
    publisher.retry_base_delay = parse_seconds("TRANSIT_PRESENCE_RETRY_BASE_DELAY_S", publisher.retry_base_delay);
    publisher.max_retry_attempts = parse_int("TRANSIT_PRESENCE_MAX_RETRIES", publisher.max_retry_attempts);
    publisher.store_timeout = parse_seconds("TRANSIT_PRESENCE_STORE_TIMEOUT_S", publisher.store_timeout);

    config.discovery.radius_m = parse_double("TRANSIT_PRESENCE_ALERT_RADIUS_M", config.discovery.radius_m);
    config.discovery.notifications_enabled =
        parse_flag("TRANSIT_PRESENCE_NOTIFICATIONS", config.discovery.notifications_enabled);
    config.discovery.notify_same_role = parse_flag("TRANSIT_PRESENCE_NOTIFY_SAME_ROLE", config.discovery.notify_same_role);

    SdkReadinessConfig& sdk = config.bootstrap.sdk;
    sdk.max_probes = parse_int("TRANSIT_PRESENCE_SDK_MAX_PROBES", sdk.max_probes);
    sdk.probe_initial_delay = parse_seconds("TRANSIT_PRESENCE_SDK_PROBE_DELAY_S", sdk.probe_initial_delay);
    sdk.probe_max_delay = parse_seconds("TRANSIT_PRESENCE_SDK_PROBE_MAX_DELAY_S", sdk.probe_max_delay);
    sdk.attempt_timeout = parse_seconds("TRANSIT_PRESENCE_SDK_TIMEOUT_S", sdk.attempt_timeout);
    sdk.max_attempts = parse_int("TRANSIT_PRESENCE_SDK_MAX_ATTEMPTS", sdk.max_attempts);

    StartupConfig& startup = config.bootstrap.startup;
    startup.critical_timeout = parse_seconds("TRANSIT_PRESENCE_CRITICAL_TIMEOUT_S", startup.critical_timeout);
    startup.non_critical_timeout = parse_seconds("TRANSIT_PRESENCE_NON_CRITICAL_TIMEOUT_S", startup.non_critical_timeout);

    config.session.location_interval = parse_seconds("TRANSIT_PRESENCE_LOCATION_INTERVAL_S", config.session.location_interval);
    config.session.teardown_timeout = parse_seconds("TRANSIT_PRESENCE_TEARDOWN_TIMEOUT_S", config.session.teardown_timeout);

    validate(config.acquisition.policy);
    validate(config.publisher);
    validate(config.bootstrap.sdk);
    validate(config.bootstrap.startup);

    logger->info(
        R"({{"component":"configuration","event":"loaded","log_dir":"{}","debounce_s":{},"settle_s":{},"max_retries":{},"radius_m":{},"critical_timeout_s":{}}})",
        config.log_directory,
        publisher.debounce_window.count(),
        publisher.settle_delay.count(),
        publisher.max_retry_attempts,
        config.discovery.radius_m,
        startup.critical_timeout.count()
    );
    return config;
}

}  // namespace transit_presence
