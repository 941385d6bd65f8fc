// === Mapping SDK =============================================================
//
// Interface of the external map rendering SDK that must be ready before the
// map screen opens, plus a scriptable implementation for the simulator and
// the tests.

#pragma once

#include <atomic>
#include <memory>

#include "transit_presence/types.hpp"

namespace transit_presence {

class MappingSdk {
  public:
    virtual ~MappingSdk() = default;

    /** @brief Kick off SDK initialization. May throw. */
    virtual void initialize() = 0;
    /** @brief Whether the SDK reports itself usable. */
    [[nodiscard]] virtual bool probe_ready() = 0;
};

using MappingSdkPtr = std::shared_ptr<MappingSdk>;

/**
 * @brief Becomes ready after a configurable number of probes.
 */
class SimulatedMappingSdk final : public MappingSdk {
  public:
    /**
     * @param probes_until_ready  Probes answered false before the first true;
     *                            negative means never ready.
     * @param initialize_delay    Blocking time spent in initialize().
     */
    explicit SimulatedMappingSdk(int probes_until_ready = 0, Duration initialize_delay = Duration{0.0});

    void initialize() override;
    [[nodiscard]] bool probe_ready() override;

    /** @brief Make the next initialize() throw. */
    void fail_next_initialize();

    [[nodiscard]] int initialize_calls() const noexcept;
    [[nodiscard]] int probe_calls() const noexcept;

  private:
    int probes_until_ready_;
    Duration initialize_delay_;
    std::atomic<bool> fail_next_initialize_{false};
    std::atomic<int> initialize_calls_{0};
    std::atomic<int> probe_calls_{0};
};

}  // namespace transit_presence
