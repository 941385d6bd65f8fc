#include "transit_presence/monitoring_state_machine.hpp"

namespace transit_presence {

std::string_view monitoring_phase_name(MonitoringPhase phase) noexcept {
    switch (phase) {
        case MonitoringPhase::Stopped:
            return "stopped";
        case MonitoringPhase::Starting:
            return "starting";
        case MonitoringPhase::Active:
            return "active";
        case MonitoringPhase::Stopping:
            return "stopping";
    }
    return "unknown";
}

MonitoringStateMachine::MonitoringStateMachine()
    : logger_(get_logger()) {}

bool MonitoringStateMachine::request_start(const SessionIdentity& identity) {
    std::scoped_lock lock(mutex_);
    switch (state_.phase) {
        case MonitoringPhase::Stopped:
        case MonitoringPhase::Stopping:
            break;
        case MonitoringPhase::Starting:
        case MonitoringPhase::Active:
            if (state_.identity && *state_.identity == identity) {
                logger_->debug("Duplicate monitoring start ignored for {}", describe(identity));
                return false;
            }
            logger_->info(
                "Monitoring triple changed from {} to {}; restarting",
                state_.identity ? describe(*state_.identity) : std::string{"<none>"},
                describe(identity)
            );
            break;
    }
    state_ = MonitoringState{MonitoringPhase::Starting, identity};
    return true;
}

bool MonitoringStateMachine::mark_started(const SessionIdentity& identity) {
    std::scoped_lock lock(mutex_);
    if (state_.phase != MonitoringPhase::Starting || !state_.identity || !(*state_.identity == identity)) {
        logger_->warn(
            R"({{"component":"monitoring","event":"mark_started_rejected","phase":"{}","identity":"{}"}})",
            monitoring_phase_name(state_.phase),
            describe(identity)
        );
        return false;
    }
    state_.phase = MonitoringPhase::Active;
    return true;
}

bool MonitoringStateMachine::request_stop() {
    std::scoped_lock lock(mutex_);
    if (state_.phase == MonitoringPhase::Stopped || state_.phase == MonitoringPhase::Stopping) {
        return false;
    }
    state_ = MonitoringState{MonitoringPhase::Stopping, std::nullopt};
    return true;
}

void MonitoringStateMachine::mark_stopped() {
    std::scoped_lock lock(mutex_);
    state_ = MonitoringState{};
}

void MonitoringStateMachine::reset_state() {
    std::scoped_lock lock(mutex_);
    logger_->warn(
        R"({{"component":"monitoring","event":"reset","phase":"{}"}})",
        monitoring_phase_name(state_.phase)
    );
    state_ = MonitoringState{};
}

MonitoringState MonitoringStateMachine::current() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

std::optional<SessionIdentity> MonitoringStateMachine::current_triple() const {
    std::scoped_lock lock(mutex_);
    return state_.identity;
}

bool MonitoringStateMachine::is_active() const {
    std::scoped_lock lock(mutex_);
    return state_.phase == MonitoringPhase::Active;
}

bool MonitoringStateMachine::is_active_or_starting() const {
    std::scoped_lock lock(mutex_);
    return state_.phase == MonitoringPhase::Active || state_.phase == MonitoringPhase::Starting;
}

}  // namespace transit_presence
