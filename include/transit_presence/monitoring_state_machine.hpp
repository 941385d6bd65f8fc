// === Monitoring State Machine ================================================
//
// Lifecycle of the discovery listener: Stopped -> Starting -> Active ->
// Stopping -> Stopped. Every transition is gated here so duplicate start or
// stop requests never register a second listener or tear down twice.

#pragma once

#include <mutex>
#include <optional>
#include <string_view>

#include "transit_presence/logging.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

enum class MonitoringPhase {
    Stopped,
    Starting,
    Active,
    Stopping
};

std::string_view monitoring_phase_name(MonitoringPhase phase) noexcept;

/**
 * @brief Phase plus the identity triple it applies to (Starting and Active only).
 */
struct MonitoringState final {
    MonitoringPhase phase{MonitoringPhase::Stopped};
    std::optional<SessionIdentity> identity{};

    bool operator==(const MonitoringState&) const = default;
};

class MonitoringStateMachine final {
  public:
    MonitoringStateMachine();

    /**
     * @brief Gate a start request.
     *
     * @return true from Stopped or Stopping, or when @p identity differs from
     *         the Starting/Active triple (forced restart). False for a
     *         duplicate request against the same triple.
     */
    bool request_start(const SessionIdentity& identity);

    /** @brief Starting -> Active when the triple matches; otherwise logs and returns false. */
    bool mark_started(const SessionIdentity& identity);

    /** @brief Starting/Active -> Stopping. False when already Stopped or Stopping. */
    bool request_stop();

    void mark_stopped();

    /** @brief Forced return to Stopped after an error. */
    void reset_state();

    [[nodiscard]] MonitoringState current() const;
    [[nodiscard]] std::optional<SessionIdentity> current_triple() const;
    [[nodiscard]] bool is_active() const;
    [[nodiscard]] bool is_active_or_starting() const;

  private:
    mutable std::mutex mutex_;
    MonitoringState state_{};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
