// === Startup Sequencer =======================================================
//
// Orchestrates application start-up. Critical stages run one after another
// under a shared time budget; the remaining best-effort stages then run in
// parallel under a second budget. Each stage runs on its own thread so a hung
// stage can be abandoned, and `on_complete` fires exactly once per sequence on
// the callback scheduler no matter how stages end.

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transit_presence/cancellation.hpp"
#include "transit_presence/errors.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/scheduler.hpp"

namespace transit_presence {

/**
 * @brief Time budgets of the two start-up phases.
 */
struct StartupConfig final {
    Duration critical_timeout{10.0};     /**< Budget shared by every critical stage. */
    Duration non_critical_timeout{20.0}; /**< Budget of the parallel best-effort phase. */
};

void validate(const StartupConfig& config);

/** @brief Body of one stage. Throws to report failure; should poll the token when long-running. */
using StageFunction = std::function<void(CancellationToken&)>;

enum class StageStatus {
    Pending,
    Running,
    Completed,
    Failed,
    TimedOut,
    Skipped,
    Cancelled
};

std::string_view stage_status_name(StageStatus status) noexcept;

/**
 * @brief Outcome handed to `on_complete`.
 */
struct StartupResult final {
    bool success{false};                    /**< Every stage completed. */
    bool cancelled{false};                  /**< cancel() interrupted the sequence. */
    bool rejected{false};                   /**< Another sequence was already running. */
    std::vector<std::string> failed_stages{};/**< Stages that failed, timed out or were skipped. */
    Duration elapsed{};                     /**< Wall time of the sequence. */
};

struct StartupCallbacks final {
    std::function<void(const std::string& stage, std::string_view event)> on_progress{};
    std::function<void(const std::string& stage, const std::string& message)> on_error{};
    std::function<void(const StartupResult& result)> on_complete{};
};

class StartupSequencer final : public std::enable_shared_from_this<StartupSequencer> {
  private:
    /** Restricts construction to create(). */
    struct ConstructionTag final {
        explicit ConstructionTag() = default;
    };

  public:
    /**
     * @param callback_context  Scheduler on which every callback is delivered.
     */
    static std::shared_ptr<StartupSequencer> create(
        SchedulerPtr callback_context,
        ErrorSinkPtr error_sink,
        StartupConfig config = {}
    );

    /**
     * @brief Register a stage. Stages run in registration order within their phase.
     *
     * Throws std::invalid_argument for duplicate names and std::logic_error
     * while a sequence runs.
     */
    void add_stage(const std::string& name, bool critical, StageFunction function);

    /**
     * @brief Run the registered stages in the background.
     *
     * Returns false when a sequence is already running; `on_complete` of
     * @p callbacks is still delivered, with `rejected` set.
     */
    bool start(StartupCallbacks callbacks);

    /** @brief Abandon the running sequence. Remaining stages are marked Cancelled. */
    void cancel();

    [[nodiscard]] std::optional<StageStatus> stage_status(const std::string& name) const;
    [[nodiscard]] bool is_running() const;

    StartupSequencer(ConstructionTag, SchedulerPtr callback_context, ErrorSinkPtr error_sink, StartupConfig config);

  private:
    struct Stage final {
        std::string name{};
        bool critical{false};
        StageFunction function{};
        StageStatus status{StageStatus::Pending};
    };


    void run_sequence(StartupCallbacks callbacks, CancellationTokenPtr sequence_token);
    /** @brief Launch one stage on its own thread; the future carries its exception. */
    std::shared_future<void> launch_stage(const Stage& stage, const CancellationTokenPtr& token);
    /** @brief Wait for a launched stage until @p deadline and record its outcome. */
    void await_stage(
        const std::string& name,
        std::shared_future<void> completion,
        TimePoint deadline,
        const CancellationTokenPtr& stage_token,
        const CancellationTokenPtr& sequence_token,
        const StartupCallbacks& callbacks
    );
    void set_status(const std::string& name, StageStatus status);
    void emit_progress(const StartupCallbacks& callbacks, const std::string& stage, std::string_view event);
    void emit_error(const StartupCallbacks& callbacks, const std::string& stage, const std::string& message);
    void emit_complete(const StartupCallbacks& callbacks, StartupResult result);

    SchedulerPtr callback_context_;
    ErrorSinkPtr error_sink_;
    StartupConfig config_;

    mutable std::mutex mutex_;
    std::vector<Stage> list_stages_;
    bool running_{false};
    CancellationTokenPtr sequence_token_;
    std::vector<CancellationTokenPtr> list_stage_tokens_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
