#include "transit_presence/startup_sequencer.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace transit_presence {

namespace {

/** Upper bound on how long a cancel() can go unnoticed while a stage runs. */
constexpr std::chrono::milliseconds k_cancel_poll_interval{50};

constexpr std::string_view k_event_starting{"Starting"};
constexpr std::string_view k_event_completed{"Completed"};

}  // namespace

void validate(const StartupConfig& config) {
    if (config.critical_timeout.count() <= 0.0 || config.non_critical_timeout.count() <= 0.0) {
        throw std::invalid_argument("StartupConfig timeouts must be positive");
    }
}

std::string_view stage_status_name(StageStatus status) noexcept {
    switch (status) {
        case StageStatus::Pending:
            return "pending";
        case StageStatus::Running:
            return "running";
        case StageStatus::Completed:
            return "completed";
        case StageStatus::Failed:
            return "failed";
        case StageStatus::TimedOut:
            return "timed_out";
        case StageStatus::Skipped:
            return "skipped";
        case StageStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::shared_ptr<StartupSequencer> StartupSequencer::create(
    SchedulerPtr callback_context,
    ErrorSinkPtr error_sink,
    StartupConfig config
) {
    return std::make_shared<StartupSequencer>(ConstructionTag{}, std::move(callback_context), std::move(error_sink), config);
}

StartupSequencer::StartupSequencer(ConstructionTag, SchedulerPtr callback_context, ErrorSinkPtr error_sink, StartupConfig config)
    : callback_context_(std::move(callback_context)),
      error_sink_(std::move(error_sink)),
      config_(config),
      logger_(get_logger()) {
    if (callback_context_ == nullptr || error_sink_ == nullptr) {
        throw std::invalid_argument("StartupSequencer requires a callback context and an error sink");
    }
    validate(config_);
}

void StartupSequencer::add_stage(const std::string& name, bool critical, StageFunction function) {
    if (name.empty() || !function) {
        throw std::invalid_argument("StartupSequencer stage requires a name and a body");
    }
    std::scoped_lock lock(mutex_);
    if (running_) {
        throw std::logic_error(fmt::format("cannot add stage {} while a sequence is running", name));
    }
    const bool duplicate = std::any_of(list_stages_.begin(), list_stages_.end(), [&name](const Stage& stage) {
        return stage.name == name;
    });
    if (duplicate) {
        throw std::invalid_argument(fmt::format("duplicate startup stage {}", name));
    }
    list_stages_.push_back(Stage{name, critical, std::move(function), StageStatus::Pending});
}

bool StartupSequencer::start(StartupCallbacks callbacks) {
    CancellationTokenPtr sequence_token;
    {
        std::scoped_lock lock(mutex_);
        if (!running_) {
            running_ = true;
            sequence_token = std::make_shared<CancellationToken>();
            sequence_token_ = sequence_token;
            list_stage_tokens_.clear();
        }
    }
    if (sequence_token == nullptr) {
        logger_->warn(R"({{"component":"startup","event":"start_rejected","reason":"already_running"}})");
        StartupResult result{};
        result.rejected = true;
        emit_complete(callbacks, result);
        return false;
    }

    logger_->info(R"({{"component":"startup","event":"sequence_started"}})");
    std::thread(&StartupSequencer::run_sequence, shared_from_this(), std::move(callbacks), sequence_token).detach();
    return true;
}

void StartupSequencer::cancel() {
    std::scoped_lock lock(mutex_);
    if (sequence_token_ == nullptr) {
        return;
    }
    sequence_token_->cancel();
    for (const CancellationTokenPtr& token : list_stage_tokens_) {
        token->cancel();
    }
    logger_->info(R"({{"component":"startup","event":"cancel_requested"}})");
}

std::optional<StageStatus> StartupSequencer::stage_status(const std::string& name) const {
    std::scoped_lock lock(mutex_);
    for (const Stage& stage : list_stages_) {
        if (stage.name == name) {
            return stage.status;
        }
    }
    return std::nullopt;
}

bool StartupSequencer::is_running() const {
    std::scoped_lock lock(mutex_);
    return running_;
}

void StartupSequencer::run_sequence(StartupCallbacks callbacks, CancellationTokenPtr sequence_token) {
    const TimePoint started = SteadyClock::now();
    std::vector<Stage> list_critical;
    std::vector<Stage> list_best_effort;
    {
        std::scoped_lock lock(mutex_);
        for (Stage& stage : list_stages_) {
            stage.status = StageStatus::Pending;
            (stage.critical ? list_critical : list_best_effort).push_back(stage);
        }
    }

    const TimePoint critical_deadline = started + to_steady(config_.critical_timeout);
    for (const Stage& stage : list_critical) {
        if (sequence_token->cancelled()) {
            set_status(stage.name, StageStatus::Cancelled);
            continue;
        }
        if (SteadyClock::now() >= critical_deadline) {
            set_status(stage.name, StageStatus::Skipped);
            emit_error(callbacks, stage.name, "critical start-up budget exhausted before the stage could run");
            continue;
        }
        auto stage_token = std::make_shared<CancellationToken>();
        emit_progress(callbacks, stage.name, k_event_starting);
        std::shared_future<void> completion = launch_stage(stage, stage_token);
        await_stage(stage.name, completion, critical_deadline, stage_token, sequence_token, callbacks);
    }

    if (sequence_token->cancelled()) {
        for (const Stage& stage : list_best_effort) {
            set_status(stage.name, StageStatus::Cancelled);
        }
    } else {
        const TimePoint best_effort_deadline = SteadyClock::now() + to_steady(config_.non_critical_timeout);
        std::vector<std::pair<CancellationTokenPtr, std::shared_future<void>>> list_launched;
        for (const Stage& stage : list_best_effort) {
            auto stage_token = std::make_shared<CancellationToken>();
            emit_progress(callbacks, stage.name, k_event_starting);
            list_launched.emplace_back(stage_token, launch_stage(stage, stage_token));
        }
        for (std::size_t index = 0; index < list_best_effort.size(); ++index) {
            await_stage(
                list_best_effort[index].name,
                list_launched[index].second,
                best_effort_deadline,
                list_launched[index].first,
                sequence_token,
                callbacks
            );
        }
    }

    StartupResult result{};
    result.cancelled = sequence_token->cancelled();
    result.elapsed = Duration{SteadyClock::now() - started};
    {
        std::scoped_lock lock(mutex_);
        for (const Stage& stage : list_stages_) {
            if (stage.status == StageStatus::Failed || stage.status == StageStatus::TimedOut
                || stage.status == StageStatus::Skipped) {
                result.failed_stages.push_back(stage.name);
            }
        }
        result.success = !result.cancelled && std::all_of(list_stages_.begin(), list_stages_.end(), [](const Stage& stage) {
            return stage.status == StageStatus::Completed;
        });
        running_ = false;
        sequence_token_.reset();
        list_stage_tokens_.clear();
    }

    logger_->info(
        R"({{"component":"startup","event":"sequence_finished","success":{},"cancelled":{},"failed":{},"elapsed_s":{:.3f}}})",
        result.success,
        result.cancelled,
        result.failed_stages.size(),
        result.elapsed.count()
    );
    emit_complete(callbacks, std::move(result));
}

std::shared_future<void> StartupSequencer::launch_stage(const Stage& stage, const CancellationTokenPtr& token) {
    {
        std::scoped_lock lock(mutex_);
        list_stage_tokens_.push_back(token);
        if (sequence_token_ != nullptr && sequence_token_->cancelled()) {
            token->cancel();
        }
    }
    set_status(stage.name, StageStatus::Running);

    auto done = std::make_shared<std::promise<void>>();
    std::shared_future<void> completion = done->get_future().share();
    std::thread([function = stage.function, token, done]() {
        try {
            function(*token);
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();
    return completion;
}

void StartupSequencer::await_stage(
    const std::string& name,
    std::shared_future<void> completion,
    TimePoint deadline,
    const CancellationTokenPtr& stage_token,
    const CancellationTokenPtr& sequence_token,
    const StartupCallbacks& callbacks
) {
    while (true) {
        const TimePoint wake = std::min(deadline, SteadyClock::now() + k_cancel_poll_interval);
        if (completion.wait_until(wake) == std::future_status::ready) {
            break;
        }
        if (sequence_token->cancelled()) {
            stage_token->cancel();
            set_status(name, StageStatus::Cancelled);
            return;
        }
        if (SteadyClock::now() >= deadline) {
            stage_token->cancel();
            set_status(name, StageStatus::TimedOut);
            logger_->warn(R"({{"component":"startup","event":"stage_timeout","stage":"{}"}})", name);
            emit_error(callbacks, name, "stage timed out");
            return;
        }
    }
    if (sequence_token->cancelled()) {
        set_status(name, StageStatus::Cancelled);
        return;
    }

    std::exception_ptr error;
    try {
        completion.get();
    } catch (...) {
        error = std::current_exception();
    }
    if (!error) {
        set_status(name, StageStatus::Completed);
        emit_progress(callbacks, name, k_event_completed);
        return;
    }

    const std::string message = describe(error);
    set_status(name, StageStatus::Failed);
    logger_->error(R"({{"component":"startup","event":"stage_failed","stage":"{}","error":"{}"}})", name, message);
    error_sink_->report(ErrorEvent{classify(error), message, name});
    emit_error(callbacks, name, message);
}

void StartupSequencer::set_status(const std::string& name, StageStatus status) {
    std::scoped_lock lock(mutex_);
    for (Stage& stage : list_stages_) {
        if (stage.name == name) {
            stage.status = status;
            return;
        }
    }
}

void StartupSequencer::emit_progress(const StartupCallbacks& callbacks, const std::string& stage, std::string_view event) {
    logger_->debug(R"({{"component":"startup","stage":"{}","event":"{}"}})", stage, event);
    if (!callbacks.on_progress) {
        return;
    }
    auto on_progress = callbacks.on_progress;
    const std::string str_event{event};
    if (callback_context_->post([on_progress, stage, str_event]() { on_progress(stage, str_event); }) == k_invalid_task) {
        on_progress(stage, str_event);
    }
}

void StartupSequencer::emit_error(const StartupCallbacks& callbacks, const std::string& stage, const std::string& message) {
    if (!callbacks.on_error) {
        return;
    }
    auto on_error = callbacks.on_error;
    if (callback_context_->post([on_error, stage, message]() { on_error(stage, message); }) == k_invalid_task) {
        on_error(stage, message);
    }
}

void StartupSequencer::emit_complete(const StartupCallbacks& callbacks, StartupResult result) {
    if (!callbacks.on_complete) {
        return;
    }
    auto on_complete = callbacks.on_complete;
    if (callback_context_->post([on_complete, result]() { on_complete(result); }) == k_invalid_task) {
        on_complete(result);
    }
}

}  // namespace transit_presence
