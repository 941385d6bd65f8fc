// === Power Monitor ===========================================================
//
// Battery level and charging state as seen by the sampling policy. Readings
// come from a `PowerStatusSource` and are cached for a short time-to-live so
// re-evaluating the policy never hammers the platform battery service.

#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "transit_presence/logging.hpp"
#include "transit_presence/scheduler.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

/**
 * @brief One battery reading.
 */
struct PowerStatus final {
    double battery_percent{100.0}; /**< Remaining charge, 0 to 100. */
    bool charging{false};          /**< Whether external power is connected. */

    bool operator==(const PowerStatus&) const = default;
};

/**
 * @brief Platform battery service. `read()` may throw.
 */
class PowerStatusSource {
  public:
    virtual ~PowerStatusSource() = default;

    [[nodiscard]] virtual PowerStatus read() = 0;
};

using PowerStatusSourcePtr = std::shared_ptr<PowerStatusSource>;

/**
 * @brief Settable source used by the simulator and tests.
 */
class SimulatedPowerSource final : public PowerStatusSource {
  public:
    explicit SimulatedPowerSource(PowerStatus initial = PowerStatus{});

    [[nodiscard]] PowerStatus read() override;

    void set(PowerStatus status);
    /** @brief Make every read throw until cleared. */
    void set_failing(bool failing);
    [[nodiscard]] int reads() const;

  private:
    mutable std::mutex mutex_;
    PowerStatus status_;
    bool failing_{false};
    int reads_{0};
};

/**
 * @brief Caches readings from a PowerStatusSource for a fixed time-to-live.
 */
class PowerMonitor final {
  public:
    /**
     * @param source       Platform battery service.
     * @param clock        Scheduler whose clock decides cache expiry.
     * @param cache_ttl    How long a reading stays fresh.
     */
    PowerMonitor(PowerStatusSourcePtr source, SchedulerPtr clock, Duration cache_ttl);

    /** @brief Cached reading, refreshed first when older than the time-to-live. */
    [[nodiscard]] PowerStatus status();

    /** @brief Re-read immediately. A failed read keeps the cached values. */
    PowerStatus refresh();

  private:
    PowerStatus refresh_locked();

    PowerStatusSourcePtr source_;
    SchedulerPtr clock_;
    Duration cache_ttl_;
    std::mutex mutex_;
    PowerStatus cached_{};
    std::optional<TimePoint> refreshed_at_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
