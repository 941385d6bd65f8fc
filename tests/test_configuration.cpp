#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "transit_presence/configuration.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

/** @brief Sets environment variables for one test and unsets them afterwards. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment& set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        list_names_.push_back(name);
        return *this;
    }

    ~ScopedEnvironment() {
        for (const std::string& name : list_names_) {
            ::unsetenv(name.c_str());
        }
    }

  private:
    std::vector<std::string> list_names_;
};
}  // namespace

TEST_CASE("ConfigurationLoader uses defaults when nothing is set") {
    const std::filesystem::path root = std::filesystem::temp_directory_path() / "transit_presence_config_root";

    const Configuration config = ConfigurationLoader::load(root);

    REQUIRE(config.log_directory == (root / "logs").string());
    REQUIRE(config.publisher.debounce_window.count() == Approx(5.0));
    REQUIRE(config.publisher.settle_delay.count() == Approx(1.0));
    REQUIRE(config.publisher.max_retry_attempts == 3);
    REQUIRE(config.discovery.radius_m == Approx(500.0));
    REQUIRE(config.discovery.notifications_enabled);
    REQUIRE_FALSE(config.discovery.notify_same_role);
    REQUIRE(config.bootstrap.startup.critical_timeout.count() == Approx(10.0));
    REQUIRE(config.bootstrap.startup.non_critical_timeout.count() == Approx(20.0));
    REQUIRE(config.acquisition.policy.low_battery_threshold_percent == Approx(20.0));
}

TEST_CASE("ConfigurationLoader reads overrides from the environment") {
    ScopedEnvironment environment;
    environment.set("TRANSIT_PRESENCE_DEBOUNCE_S", "2.5")
        .set("TRANSIT_PRESENCE_MAX_RETRIES", "5")
        .set("TRANSIT_PRESENCE_ALERT_RADIUS_M", "750")
        .set("TRANSIT_PRESENCE_NOTIFICATIONS", "off")
        .set("TRANSIT_PRESENCE_NOTIFY_SAME_ROLE", "true")
        .set("TRANSIT_PRESENCE_LOW_BATTERY_PERCENT", "15")
        .set("TRANSIT_PRESENCE_TEARDOWN_TIMEOUT_S", "3")
        .set("TRANSIT_PRESENCE_LOG_DIR", "/tmp/transit_presence_custom_logs");

    const Configuration config = ConfigurationLoader::load(".");

    REQUIRE(config.log_directory == "/tmp/transit_presence_custom_logs");
    REQUIRE(config.publisher.debounce_window.count() == Approx(2.5));
    REQUIRE(config.publisher.max_retry_attempts == 5);
    REQUIRE(config.discovery.radius_m == Approx(750.0));
    REQUIRE_FALSE(config.discovery.notifications_enabled);
    REQUIRE(config.discovery.notify_same_role);
    REQUIRE(config.acquisition.policy.low_battery_threshold_percent == Approx(15.0));
    REQUIRE(config.session.teardown_timeout.count() == Approx(3.0));
}

TEST_CASE("ConfigurationLoader falls back on unparsable or non-positive values") {
    ScopedEnvironment environment;
    environment.set("TRANSIT_PRESENCE_SETTLE_DELAY_S", "soon")
        .set("TRANSIT_PRESENCE_MAX_RETRIES", "-2")
        .set("TRANSIT_PRESENCE_ALERT_RADIUS_M", "0")
        .set("TRANSIT_PRESENCE_NOTIFICATIONS", "maybe");

    const Configuration config = ConfigurationLoader::load(".");

    REQUIRE(config.publisher.settle_delay.count() == Approx(1.0));
    REQUIRE(config.publisher.max_retry_attempts == 3);
    REQUIRE(config.discovery.radius_m == Approx(500.0));
    REQUIRE(config.discovery.notifications_enabled);
}

TEST_CASE("Configuration hands its component settings to a session") {
    ScopedEnvironment environment;
    environment.set("TRANSIT_PRESENCE_MIN_DISTANCE_M", "25").set("TRANSIT_PRESENCE_LOCATION_INTERVAL_S", "30");

    const Configuration config = ConfigurationLoader::load(".");
    const PresenceSessionSettings settings = config.session_settings();

    REQUIRE(settings.publisher.min_distance_m == Approx(25.0));
    REQUIRE(settings.session.location_interval.count() == Approx(30.0));
    REQUIRE(settings.discovery.radius_m == Approx(config.discovery.radius_m));
    REQUIRE(settings.acquisition.power_cache_ttl.count() == Approx(config.acquisition.power_cache_ttl.count()));
}
