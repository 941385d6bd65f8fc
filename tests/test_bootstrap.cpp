#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "transit_presence/mapping_sdk.hpp"
#include "transit_presence/scheduler.hpp"
#include "transit_presence/sdk_readiness_guard.hpp"
#include "transit_presence/startup_sequencer.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

SdkReadinessConfig fast_sdk_config() {
    SdkReadinessConfig config{};
    config.max_probes = 4;
    config.probe_initial_delay = Duration{0.01};
    config.probe_max_delay = Duration{0.02};
    config.attempt_timeout = Duration{2.0};
    config.max_attempts = 3;
    return config;
}

/** Collects callbacks of one sequence and exposes the completion as a future. */
struct StartupRecorder final {
    std::mutex mutex;
    std::vector<std::string> progress;
    std::vector<std::string> failures;
    std::shared_ptr<std::promise<StartupResult>> completion{std::make_shared<std::promise<StartupResult>>()};
    std::future<StartupResult> result{completion->get_future()};

    StartupCallbacks callbacks() {
        StartupCallbacks callbacks{};
        callbacks.on_progress = [this](const std::string& stage, std::string_view event) {
            std::scoped_lock lock(mutex);
            progress.push_back(stage + ":" + std::string{event});
        };
        callbacks.on_error = [this](const std::string& stage, const std::string&) {
            std::scoped_lock lock(mutex);
            failures.push_back(stage);
        };
        callbacks.on_complete = [promise = completion](const StartupResult& outcome) { promise->set_value(outcome); };
        return callbacks;
    }

    StartupResult wait() {
        REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        return result.get();
    }
};
}  // namespace

TEST_CASE("SdkReadinessGuard probes with backoff until the SDK is ready") {
    auto sdk = std::make_shared<SimulatedMappingSdk>(2);
    auto errors = std::make_shared<RecordingErrorSink>();
    auto guard = SdkReadinessGuard::create(sdk, errors, fast_sdk_config());

    REQUIRE(guard->ensure_ready());
    REQUIRE(guard->state().phase == SdkInitPhase::Completed);
    REQUIRE(sdk->initialize_calls() == 1);
    REQUIRE(sdk->probe_calls() == 3);
    REQUIRE(guard->stats().probes == 3);
    REQUIRE(guard->stats().last_attempt.has_value());

    REQUIRE(guard->ensure_ready());
    REQUIRE(sdk->initialize_calls() == 1);
    REQUIRE(errors->events().empty());
}

TEST_CASE("SdkReadinessGuard shares one attempt between concurrent callers") {
    auto sdk = std::make_shared<SimulatedMappingSdk>(1, Duration{0.05});
    auto guard = SdkReadinessGuard::create(sdk, std::make_shared<RecordingErrorSink>(), fast_sdk_config());

    std::vector<std::future<bool>> callers;
    for (int index = 0; index < 4; ++index) {
        callers.push_back(std::async(std::launch::async, [guard]() { return guard->ensure_ready(); }));
    }
    for (std::future<bool>& caller : callers) {
        REQUIRE(caller.get());
    }
    REQUIRE(sdk->initialize_calls() == 1);
    REQUIRE(guard->stats().attempts == 1);
}

TEST_CASE("SdkReadinessGuard reports failures and stops after the attempt budget") {
    auto errors = std::make_shared<RecordingErrorSink>();

    SECTION("never ready") {
        auto sdk = std::make_shared<SimulatedMappingSdk>(-1);
        auto guard = SdkReadinessGuard::create(sdk, errors, fast_sdk_config());
        for (int attempt = 0; attempt < 3; ++attempt) {
            REQUIRE_FALSE(guard->ensure_ready());
        }
        REQUIRE(guard->state().failure_reason == "not_ready");
        REQUIRE(errors->count(ErrorKind::SdkInitTimeout) == 3);

        REQUIRE_FALSE(guard->ensure_ready());
        REQUIRE(sdk->initialize_calls() == 3);

        guard->reset();
        REQUIRE(guard->state().phase == SdkInitPhase::NotStarted);
        REQUIRE(guard->state().attempts == 0);
    }

    SECTION("initialize throws once") {
        auto sdk = std::make_shared<SimulatedMappingSdk>(0);
        sdk->fail_next_initialize();
        auto guard = SdkReadinessGuard::create(sdk, errors, fast_sdk_config());
        REQUIRE_FALSE(guard->ensure_ready());
        REQUIRE(guard->state().failure_reason == "mapping SDK failed to initialize");
        REQUIRE(guard->ensure_ready());
        REQUIRE(guard->state().attempts == 2);
    }

    SECTION("attempt timeout") {
        SdkReadinessConfig config = fast_sdk_config();
        config.attempt_timeout = Duration{0.1};
        auto sdk = std::make_shared<SimulatedMappingSdk>(0, Duration{0.5});
        auto guard = SdkReadinessGuard::create(sdk, errors, config);
        REQUIRE_FALSE(guard->ensure_ready());
        REQUIRE(guard->state().failure_reason == "timeout");
        REQUIRE(guard->stats().timeouts == 1);
        REQUIRE(errors->count(ErrorKind::SdkInitTimeout) == 1);
    }
}

TEST_CASE("SdkReadinessGuard pre-initializes in the background") {
    auto sdk = std::make_shared<SimulatedMappingSdk>(0);
    auto guard = SdkReadinessGuard::create(sdk, std::make_shared<RecordingErrorSink>(), fast_sdk_config());
    guard->pre_initialize();
    guard->pre_initialize();
    REQUIRE(guard->ensure_ready());
    REQUIRE(sdk->initialize_calls() == 1);
}

TEST_CASE("StartupSequencer runs critical stages in order before best-effort stages") {
    auto callbacks_context = std::make_shared<ThreadScheduler>("startup_callbacks");
    auto errors = std::make_shared<RecordingErrorSink>();
    auto sequencer = StartupSequencer::create(callbacks_context, errors);
    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        return [&, name](CancellationToken&) {
            std::scoped_lock lock(mutex);
            order.push_back(name);
        };
    };
    sequencer->add_stage("config", true, record("config"));
    sequencer->add_stage("sdk", true, record("sdk"));
    sequencer->add_stage("prefetch", false, record("prefetch"));
    REQUIRE_THROWS_AS(sequencer->add_stage("sdk", false, record("sdk")), std::invalid_argument);

    StartupRecorder recorder{};
    REQUIRE(sequencer->start(recorder.callbacks()));
    const StartupResult result = recorder.wait();

    REQUIRE(result.success);
    REQUIRE(result.failed_stages.empty());
    REQUIRE(order == std::vector<std::string>{"config", "sdk", "prefetch"});
    REQUIRE(sequencer->stage_status("prefetch") == StageStatus::Completed);
    REQUIRE_FALSE(sequencer->stage_status("unknown").has_value());
    std::scoped_lock lock(recorder.mutex);
    REQUIRE(recorder.progress.front() == "config:Starting");
    REQUIRE(recorder.progress.size() == 6);
}

TEST_CASE("StartupSequencer records failures and timeouts without hanging") {
    auto callbacks_context = std::make_shared<ThreadScheduler>("startup_callbacks");
    auto errors = std::make_shared<RecordingErrorSink>();
    StartupConfig config{};
    config.critical_timeout = Duration{0.3};
    config.non_critical_timeout = Duration{0.3};
    auto sequencer = StartupSequencer::create(callbacks_context, errors, config);

    sequencer->add_stage("broken", true, [](CancellationToken&) { throw PresenceError(ErrorKind::LocationError, "no gps"); });
    sequencer->add_stage("hung", true, [](CancellationToken& token) { token.wait_for(Duration{5.0}); });
    sequencer->add_stage("late", true, [](CancellationToken&) {});
    sequencer->add_stage("slow_extra", false, [](CancellationToken& token) { token.wait_for(Duration{5.0}); });
    sequencer->add_stage("quick_extra", false, [](CancellationToken&) {});

    StartupRecorder recorder{};
    sequencer->start(recorder.callbacks());
    const StartupResult result = recorder.wait();

    REQUIRE_FALSE(result.success);
    REQUIRE(sequencer->stage_status("broken") == StageStatus::Failed);
    REQUIRE(sequencer->stage_status("hung") == StageStatus::TimedOut);
    REQUIRE(sequencer->stage_status("late") == StageStatus::Skipped);
    REQUIRE(sequencer->stage_status("slow_extra") == StageStatus::TimedOut);
    REQUIRE(sequencer->stage_status("quick_extra") == StageStatus::Completed);
    REQUIRE(result.failed_stages.size() == 4);
    REQUIRE(errors->count(ErrorKind::LocationError) == 1);
    REQUIRE(result.elapsed < Duration{2.0});
    std::scoped_lock lock(recorder.mutex);
    REQUIRE(recorder.failures.size() == 4);
}

TEST_CASE("StartupSequencer rejects a second start and honours cancel") {
    auto callbacks_context = std::make_shared<ThreadScheduler>("startup_callbacks");
    auto sequencer = StartupSequencer::create(callbacks_context, std::make_shared<RecordingErrorSink>());
    auto entered = std::make_shared<std::promise<void>>();
    sequencer->add_stage("wait_for_user", true, [entered](CancellationToken& token) {
        entered->set_value();
        token.wait_for(Duration{5.0});
    });
    sequencer->add_stage("extra", false, [](CancellationToken&) {});

    StartupRecorder first{};
    REQUIRE(sequencer->start(first.callbacks()));
    REQUIRE(entered->get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    REQUIRE(sequencer->is_running());
    REQUIRE_THROWS_AS(sequencer->add_stage("another", false, [](CancellationToken&) {}), std::logic_error);

    StartupRecorder second{};
    REQUIRE_FALSE(sequencer->start(second.callbacks()));
    REQUIRE(second.wait().rejected);

    sequencer->cancel();
    const StartupResult result = first.wait();
    REQUIRE(result.cancelled);
    REQUIRE_FALSE(result.success);
    REQUIRE(sequencer->stage_status("wait_for_user") == StageStatus::Cancelled);
    REQUIRE(sequencer->stage_status("extra") == StageStatus::Cancelled);
    REQUIRE_FALSE(sequencer->is_running());
}

TEST_CASE("StartupSequencer completes when a stage throws a non-standard exception") {
    auto callbacks_context = std::make_shared<ThreadScheduler>("startup_callbacks");
    auto errors = std::make_shared<RecordingErrorSink>();
    auto sequencer = StartupSequencer::create(callbacks_context, errors);

    sequencer->add_stage("odd_failure", true, [](CancellationToken&) { throw 42; });
    sequencer->add_stage("after", false, [](CancellationToken&) {});

    StartupRecorder recorder{};
    sequencer->start(recorder.callbacks());
    const StartupResult result = recorder.wait();

    REQUIRE_FALSE(result.success);
    REQUIRE(sequencer->stage_status("odd_failure") == StageStatus::Failed);
    REQUIRE(sequencer->stage_status("after") == StageStatus::Completed);
    REQUIRE(errors->events().size() == 1);
}

namespace {
class OddlyFailingSdk final : public MappingSdk {
  public:
    void initialize() override {
        throw 7;
    }

    bool probe_ready() override {
        return false;
    }
};
}  // namespace

TEST_CASE("SdkReadinessGuard fails cleanly when the SDK throws a non-standard exception") {
    auto errors = std::make_shared<RecordingErrorSink>();
    auto guard = SdkReadinessGuard::create(std::make_shared<OddlyFailingSdk>(), errors, fast_sdk_config());

    REQUIRE_FALSE(guard->ensure_ready());
    REQUIRE(guard->state().phase == SdkInitPhase::Failed);
    REQUIRE(guard->state().failure_reason == "mapping SDK raised a non-standard exception");
    REQUIRE(errors->count(ErrorKind::SdkInitTimeout) == 1);
}
