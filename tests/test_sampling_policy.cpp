#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_scheduler.hpp"
#include "transit_presence/consumer_registry.hpp"
#include "transit_presence/errors.hpp"
#include "transit_presence/power_monitor.hpp"
#include "transit_presence/sampling_policy.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

const ConsumerDemand k_demand{Duration{30.0}, LocationPriority::Balanced};
}  // namespace

TEST_CASE("Sampling policy table selects parameters by device context") {
    const SamplingPolicyConfig config{};

    SECTION("charging wins over everything and keeps the requested interval") {
        const DeviceContext context{false, PowerStatus{5.0, true}};
        const SamplingParameters parameters = select_sampling_parameters(k_demand, context, config);
        REQUIRE(select_sampling_mode(context, config) == SamplingMode::Charging);
        REQUIRE(parameters.priority == LocationPriority::HighAccuracy);
        REQUIRE(parameters.interval == Duration{30.0});
        REQUIRE(parameters.min_interval == Duration{15.0});
        REQUIRE(parameters.min_displacement_m == 10.0);
    }

    SECTION("low battery in the background throttles hard") {
        const DeviceContext context{false, PowerStatus{19.0, false}};
        const SamplingParameters parameters = select_sampling_parameters(k_demand, context, config);
        REQUIRE(parameters.priority == LocationPriority::LowPower);
        REQUIRE(parameters.interval == Duration{600.0});
        REQUIRE(parameters.min_interval == Duration{600.0});
        REQUIRE(parameters.min_displacement_m == 100.0);
    }

    SECTION("background on a healthy battery is balanced") {
        const DeviceContext context{false, PowerStatus{60.0, false}};
        const SamplingParameters parameters = select_sampling_parameters(k_demand, context, config);
        REQUIRE(parameters.priority == LocationPriority::Balanced);
        REQUIRE(parameters.interval == Duration{300.0});
        REQUIRE(parameters.min_interval == Duration{120.0});
        REQUIRE(parameters.min_displacement_m == 50.0);
    }

    SECTION("foreground honours the merged demand even on low battery") {
        const DeviceContext context{true, PowerStatus{10.0, false}};
        const SamplingParameters parameters = select_sampling_parameters(k_demand, context, config);
        REQUIRE(select_sampling_mode(context, config) == SamplingMode::Foreground);
        REQUIRE(parameters.priority == LocationPriority::Balanced);
        REQUIRE(parameters.interval == Duration{30.0});
        REQUIRE(parameters.min_displacement_m == 20.0);
    }

    SECTION("the minimum interval never exceeds the interval") {
        const ConsumerDemand fast{Duration{5.0}, LocationPriority::HighAccuracy};
        const SamplingParameters parameters = select_sampling_parameters(fast, DeviceContext{}, config);
        REQUIRE(parameters.min_interval == Duration{5.0});
    }
}

TEST_CASE("Sampling policy config rejects non-positive values") {
    SamplingPolicyConfig config{};
    config.background_min_displacement_m = 0.0;
    REQUIRE_THROWS_AS(validate(config), std::invalid_argument);
}

TEST_CASE("ConsumerRegistry merges demand and reports changes") {
    ConsumerRegistry registry{};

    REQUIRE(registry.request_updates("map", Duration{30.0}, LocationPriority::Balanced));
    REQUIRE_FALSE(registry.request_updates("list", Duration{60.0}, LocationPriority::LowPower));
    REQUIRE(registry.request_updates("session", Duration{15.0}, LocationPriority::HighAccuracy));

    const auto demand = registry.effective_demand();
    REQUIRE(demand.has_value());
    REQUIRE(demand->interval == Duration{15.0});
    REQUIRE(demand->priority == LocationPriority::HighAccuracy);
    REQUIRE(registry.active_consumers().size() == 3);
    REQUIRE(registry.debug_info().find("consumers=3") != std::string::npos);

    REQUIRE_FALSE(registry.release_updates("unknown"));
    REQUIRE_FALSE(registry.release_updates("map"));
    REQUIRE_FALSE(registry.release_updates("session"));
    REQUIRE(registry.release_updates("list"));
    REQUIRE_FALSE(registry.is_active());
    REQUIRE_FALSE(registry.effective_demand().has_value());
}

TEST_CASE("ConsumerRegistry validates requests and supports rollback") {
    ConsumerRegistry registry{};
    REQUIRE_THROWS_AS(registry.request_updates("", Duration{10.0}, LocationPriority::Balanced), PresenceError);
    REQUIRE_THROWS_AS(registry.request_updates("map", Duration{0.0}, LocationPriority::Balanced), PresenceError);

    registry.request_updates("map", Duration{10.0}, LocationPriority::Balanced);
    const ConsumerSnapshot saved = registry.snapshot();
    registry.request_updates("nav", Duration{1.0}, LocationPriority::HighAccuracy);
    registry.restore(saved);
    REQUIRE(registry.active_consumers() == std::vector<std::string>{"map"});

    registry.force_stop();
    REQUIRE_FALSE(registry.is_active());
}

TEST_CASE("PowerMonitor caches readings and keeps the last value on failure") {
    auto clock = std::make_shared<test::ManualScheduler>();
    auto source = std::make_shared<SimulatedPowerSource>(PowerStatus{80.0, false});
    PowerMonitor monitor{source, clock, Duration{30.0}};

    REQUIRE(monitor.status().battery_percent == 80.0);
    source->set(PowerStatus{40.0, true});
    REQUIRE(monitor.status().battery_percent == 80.0);
    REQUIRE(source->reads() == 1);

    clock->advance(Duration{30.0});
    REQUIRE(monitor.status() == PowerStatus{40.0, true});

    source->set_failing(true);
    REQUIRE(monitor.refresh() == PowerStatus{40.0, true});
    REQUIRE(source->reads() == 3);
}
