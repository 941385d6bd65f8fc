#include "transit_presence/sdk_readiness_guard.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace transit_presence {

void validate(const SdkReadinessConfig& config) {
    if (config.max_probes <= 0) {
        throw std::invalid_argument("SdkReadinessConfig.max_probes must be positive");
    }
    if (config.probe_initial_delay.count() <= 0.0 || config.probe_max_delay < config.probe_initial_delay) {
        throw std::invalid_argument("SdkReadinessConfig probe delays must be positive and ordered");
    }
    if (config.attempt_timeout.count() <= 0.0) {
        throw std::invalid_argument("SdkReadinessConfig.attempt_timeout must be positive");
    }
    if (config.max_attempts <= 0) {
        throw std::invalid_argument("SdkReadinessConfig.max_attempts must be positive");
    }
}

std::string_view sdk_init_phase_name(SdkInitPhase phase) noexcept {
    switch (phase) {
        case SdkInitPhase::NotStarted:
            return "not_started";
        case SdkInitPhase::InProgress:
            return "in_progress";
        case SdkInitPhase::Completed:
            return "completed";
        case SdkInitPhase::Failed:
            return "failed";
    }
    return "unknown";
}

std::shared_ptr<SdkReadinessGuard> SdkReadinessGuard::create(
    MappingSdkPtr sdk,
    ErrorSinkPtr error_sink,
    SdkReadinessConfig config
) {
    return std::make_shared<SdkReadinessGuard>(ConstructionTag{}, std::move(sdk), std::move(error_sink), config);
}

SdkReadinessGuard::SdkReadinessGuard(ConstructionTag, MappingSdkPtr sdk, ErrorSinkPtr error_sink, SdkReadinessConfig config)
    : sdk_(std::move(sdk)),
      error_sink_(std::move(error_sink)),
      config_(config),
      logger_(get_logger()) {
    if (sdk_ == nullptr || error_sink_ == nullptr) {
        throw std::invalid_argument("SdkReadinessGuard requires an SDK and an error sink");
    }
    validate(config_);
}

bool SdkReadinessGuard::ensure_ready() {
    std::shared_future<bool> attempt;
    {
        std::scoped_lock lock(mutex_);
        switch (state_.phase) {
            case SdkInitPhase::Completed:
                return true;
            case SdkInitPhase::InProgress:
                attempt = *in_flight_;
                break;
            case SdkInitPhase::NotStarted:
            case SdkInitPhase::Failed:
                if (state_.attempts >= config_.max_attempts) {
                    logger_->warn(
                        R"({{"component":"sdk_guard","event":"attempts_exhausted","attempts":{},"reason":"{}"}})",
                        state_.attempts,
                        state_.failure_reason
                    );
                    return false;
                }
                attempt = launch_locked();
                break;
        }
    }
    return attempt.get();
}

void SdkReadinessGuard::pre_initialize() {
    std::scoped_lock lock(mutex_);
    if (state_.phase != SdkInitPhase::NotStarted) {
        return;
    }
    logger_->info("Pre-initializing mapping SDK in the background");
    launch_locked();
}

void SdkReadinessGuard::reset() {
    std::scoped_lock lock(mutex_);
    if (in_flight_token_ != nullptr) {
        in_flight_token_->cancel();
    }
    ++epoch_;
    in_flight_.reset();
    in_flight_token_.reset();
    state_ = SdkInitState{};
    stats_ = SdkInitStats{};
    logger_->info(R"({{"component":"sdk_guard","event":"reset"}})");
}

SdkInitState SdkReadinessGuard::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

SdkInitStats SdkReadinessGuard::stats() const {
    std::scoped_lock lock(mutex_);
    return stats_;
}

std::shared_future<bool> SdkReadinessGuard::launch_locked() {
    const std::uint64_t epoch = ++epoch_;
    auto token = std::make_shared<CancellationToken>();
    auto result = std::make_shared<std::promise<bool>>();
    std::shared_future<bool> attempt = result->get_future().share();

    ++state_.attempts;
    ++stats_.attempts;
    state_.phase = SdkInitPhase::InProgress;
    state_.failure_reason.clear();
    in_flight_ = attempt;
    in_flight_token_ = token;

    logger_->info(
        R"({{"component":"sdk_guard","event":"attempt","attempt":{},"max_attempts":{}}})",
        state_.attempts,
        config_.max_attempts
    );
    std::thread(&SdkReadinessGuard::supervise, shared_from_this(), epoch, token, result).detach();
    return attempt;
}

void SdkReadinessGuard::supervise(
    std::uint64_t epoch,
    CancellationTokenPtr token,
    std::shared_ptr<std::promise<bool>> result
) {
    const TimePoint started = SteadyClock::now();
    auto work = std::make_shared<std::promise<bool>>();
    std::future<bool> work_done = work->get_future();
    std::thread([self = shared_from_this(), token, work]() {
        try {
            work->set_value(self->initialize_and_probe(*token));
        } catch (...) {
            work->set_exception(std::current_exception());
        }
    }).detach();

    bool ready = false;
    bool timed_out = false;
    std::string reason;
    if (work_done.wait_for(to_steady(config_.attempt_timeout)) != std::future_status::ready) {
        token->cancel();
        timed_out = true;
        reason = "timeout";
    } else {
        try {
            ready = work_done.get();
            if (!ready) {
                reason = token->cancelled() ? "cancelled" : "not_ready";
            }
        } catch (const std::exception& exc) {
            reason = exc.what();
        } catch (...) {
            reason = "mapping SDK raised a non-standard exception";
        }
    }

    finish(epoch, ready, reason, Duration{SteadyClock::now() - started}, timed_out);
    result->set_value(ready);
}

bool SdkReadinessGuard::initialize_and_probe(CancellationToken& token) {
    sdk_->initialize();
    Duration delay = config_.probe_initial_delay;
    for (int probe = 1; probe <= config_.max_probes; ++probe) {
        if (token.cancelled()) {
            return false;
        }
        {
            std::scoped_lock lock(mutex_);
            ++stats_.probes;
        }
        if (sdk_->probe_ready()) {
            logger_->debug("Mapping SDK ready after {} probes", probe);
            return true;
        }
        if (probe == config_.max_probes) {
            break;
        }
        if (token.wait_for(delay)) {
            return false;
        }
        delay = std::min(delay * 2.0, config_.probe_max_delay);
    }
    return false;
}

void SdkReadinessGuard::finish(
    std::uint64_t epoch,
    bool ready,
    const std::string& reason,
    Duration elapsed,
    bool timed_out
) {
    {
        std::scoped_lock lock(mutex_);
        if (epoch != epoch_) {
            logger_->debug("Discarding result of superseded SDK attempt");
            return;
        }
        stats_.last_attempt = elapsed;
        if (timed_out) {
            ++stats_.timeouts;
        }
        state_.phase = ready ? SdkInitPhase::Completed : SdkInitPhase::Failed;
        state_.failure_reason = ready ? std::string{} : reason;
        in_flight_.reset();
        in_flight_token_.reset();
    }

    if (ready) {
        logger_->info(
            R"({{"component":"sdk_guard","event":"ready","elapsed_s":{:.3f}}})",
            elapsed.count()
        );
        return;
    }
    error_sink_->report(ErrorEvent{
        ErrorKind::SdkInitTimeout,
        fmt::format("mapping SDK not ready ({}) after {:.2f}s", reason, elapsed.count()),
        "sdk_readiness_guard"
    });
}

}  // namespace transit_presence
