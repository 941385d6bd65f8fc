#include "transit_presence/mapping_sdk.hpp"

#include <thread>

#include "transit_presence/errors.hpp"

namespace transit_presence {

SimulatedMappingSdk::SimulatedMappingSdk(int probes_until_ready, Duration initialize_delay)
    : probes_until_ready_(probes_until_ready),
      initialize_delay_(initialize_delay) {}

void SimulatedMappingSdk::initialize() {
    ++initialize_calls_;
    if (initialize_delay_.count() > 0.0) {
        std::this_thread::sleep_for(to_steady(initialize_delay_));
    }
    if (fail_next_initialize_.exchange(false)) {
        throw PresenceError(ErrorKind::SdkInitTimeout, "mapping SDK failed to initialize");
    }
}

bool SimulatedMappingSdk::probe_ready() {
    const int probe = ++probe_calls_;
    if (probes_until_ready_ < 0) {
        return false;
    }
    return probe > probes_until_ready_;
}

void SimulatedMappingSdk::fail_next_initialize() {
    fail_next_initialize_ = true;
}

int SimulatedMappingSdk::initialize_calls() const noexcept {
    return initialize_calls_.load();
}

int SimulatedMappingSdk::probe_calls() const noexcept {
    return probe_calls_.load();
}

}  // namespace transit_presence
