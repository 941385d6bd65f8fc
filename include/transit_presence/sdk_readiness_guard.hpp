// === SDK Readiness Guard =====================================================
//
// Makes sure the mapping SDK is initialized exactly once before anything that
// renders a map runs. Concurrent callers share one in-flight attempt; every
// attempt probes readiness with capped exponential backoff under an overall
// timeout, and abandoned attempts are cancelled cooperatively.

#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "transit_presence/cancellation.hpp"
#include "transit_presence/errors.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/mapping_sdk.hpp"

namespace transit_presence {

/**
 * @brief Tunables for SDK readiness.
 */
struct SdkReadinessConfig final {
    int max_probes{10};               /**< Probes per attempt. */
    Duration probe_initial_delay{0.1};/**< Delay after the first failed probe. */
    Duration probe_max_delay{2.0};    /**< Cap of the doubling probe delay. */
    Duration attempt_timeout{10.0};   /**< Bound on one whole attempt. */
    int max_attempts{5};              /**< Attempts allowed until reset(). */
};

void validate(const SdkReadinessConfig& config);

enum class SdkInitPhase {
    NotStarted,
    InProgress,
    Completed,
    Failed
};

std::string_view sdk_init_phase_name(SdkInitPhase phase) noexcept;

struct SdkInitState final {
    SdkInitPhase phase{SdkInitPhase::NotStarted};
    std::string failure_reason{}; /**< Set when Failed ("timeout", "not_ready", or the SDK's message). */
    int attempts{};               /**< Attempts started since the last reset. */
};

struct SdkInitStats final {
    int attempts{};                       /**< Attempts started since the last reset. */
    int timeouts{};                       /**< Attempts abandoned on timeout. */
    int probes{};                         /**< Readiness probes issued. */
    std::optional<Duration> last_attempt{};/**< Duration of the last finished attempt. */
};

class SdkReadinessGuard final : public std::enable_shared_from_this<SdkReadinessGuard> {
  private:
    /** Restricts construction to create(). */
    struct ConstructionTag final {
        explicit ConstructionTag() = default;
    };

  public:
    static std::shared_ptr<SdkReadinessGuard> create(MappingSdkPtr sdk, ErrorSinkPtr error_sink, SdkReadinessConfig config = {});

    /**
     * @brief Block until the SDK is ready or the attempt fails.
     *
     * Joins the in-flight attempt when there is one. Returns false without
     * trying once the attempt budget is spent.
     */
    bool ensure_ready();

    /** @brief Start an attempt in the background when none has started yet. */
    void pre_initialize();

    /** @brief Cancel any in-flight attempt and forget all history. */
    void reset();

    [[nodiscard]] SdkInitState state() const;
    [[nodiscard]] SdkInitStats stats() const;

    SdkReadinessGuard(ConstructionTag, MappingSdkPtr sdk, ErrorSinkPtr error_sink, SdkReadinessConfig config);

  private:

    /** @brief Start a new attempt; mutex held. */
    std::shared_future<bool> launch_locked();
    void supervise(std::uint64_t epoch, CancellationTokenPtr token, std::shared_ptr<std::promise<bool>> result);
    bool initialize_and_probe(CancellationToken& token);
    void finish(std::uint64_t epoch, bool ready, const std::string& reason, Duration elapsed, bool timed_out);

    MappingSdkPtr sdk_;
    ErrorSinkPtr error_sink_;
    SdkReadinessConfig config_;

    mutable std::mutex mutex_;
    SdkInitState state_{};
    SdkInitStats stats_{};
    std::uint64_t epoch_{0};
    std::optional<std::shared_future<bool>> in_flight_;
    CancellationTokenPtr in_flight_token_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
