#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "transit_presence/configuration.hpp"
#include "transit_presence/geodesy.hpp"
#include "transit_presence/in_memory_presence_store.hpp"
#include "transit_presence/logging.hpp"
#include "transit_presence/mapping_sdk.hpp"
#include "transit_presence/presence_session.hpp"
#include "transit_presence/scheduler.hpp"
#include "transit_presence/sdk_readiness_guard.hpp"
#include "transit_presence/startup_sequencer.hpp"
#include "transit_presence/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr int k_run_ticks{20};
constexpr double k_step_m{80.0};
constexpr double k_start_separation_m{1'500.0};
constexpr std::string_view k_destination{"central_station"};

void handle_signal(int) {
    should_terminate.store(true);
}

struct SimulatedParticipant final {
    std::string participant_id{};
    std::shared_ptr<transit_presence::SimulatedLocationProvider> provider{};
    std::unique_ptr<transit_presence::PresenceSession> session{};
    transit_presence::GeodeticCoordinate position{};
    double bearing_deg{};
};

SimulatedParticipant make_participant(
    const std::string& participant_id,
    const std::shared_ptr<transit_presence::InMemoryPresenceStore>& server,
    const transit_presence::SchedulerPtr& callback_context,
    const transit_presence::SchedulerPtr& io_context,
    const transit_presence::ErrorSinkPtr& error_sink,
    const transit_presence::Configuration& configuration,
    transit_presence::GeodeticCoordinate position,
    double bearing_deg
) {
    using namespace transit_presence;

    SimulatedParticipant participant{};
    participant.participant_id = participant_id;
    participant.provider = std::make_shared<SimulatedLocationProvider>();
    participant.provider->set_last_known(position);
    participant.position = position;
    participant.bearing_deg = bearing_deg;
    participant.session = std::make_unique<PresenceSession>(
        server->connect(participant_id),
        participant.provider,
        std::make_shared<SimulatedPowerSource>(PowerStatus{80.0, false}),
        callback_context,
        io_context,
        error_sink,
        configuration.session_settings()
    );
    participant.session->set_notification_sink([participant_id](const ProximityNotification& notification) {
        fmt::print(
            "[{}] {} {} is {:.0f} m away heading to {}\n",
            participant_id,
            role_name(notification.role),
            notification.participant_id,
            notification.distance_m,
            notification.destination
        );
    });
    return participant;
}

/** @brief Register the start-up stages and block until the sequence reports completion. */
transit_presence::StartupResult run_startup(
    const transit_presence::Configuration& configuration,
    const transit_presence::SchedulerPtr& scheduler,
    const transit_presence::ErrorSinkPtr& error_sink
) {
    using namespace transit_presence;

    auto sdk = std::make_shared<SimulatedMappingSdk>(3, Duration{0.05});
    auto guard = SdkReadinessGuard::create(sdk, error_sink, configuration.bootstrap.sdk);
    guard->pre_initialize();

    auto sequencer = StartupSequencer::create(scheduler, error_sink, configuration.bootstrap.startup);
    sequencer->add_stage("mapping_sdk", true, [guard](CancellationToken&) {
        if (!guard->ensure_ready()) {
            throw PresenceError(ErrorKind::SdkInitTimeout, guard->state().failure_reason);
        }
    });
    sequencer->add_stage("warm_caches", false, [](CancellationToken& token) {
        token.wait_for(Duration{0.1});
    });

    auto completion = std::make_shared<std::promise<StartupResult>>();
    std::future<StartupResult> result = completion->get_future();
    StartupCallbacks callbacks{};
    callbacks.on_progress = [](const std::string& stage, std::string_view event) {
        get_logger()->info(R"({{"component":"simulator","stage":"{}","event":"{}"}})", stage, event);
    };
    callbacks.on_error = [](const std::string& stage, const std::string& message) {
        get_logger()->warn(R"({{"component":"simulator","stage":"{}","error":"{}"}})", stage, message);
    };
    callbacks.on_complete = [completion](const StartupResult& outcome) { completion->set_value(outcome); };
    sequencer->start(std::move(callbacks));
    return result.get();
}

}  // namespace

int main() {
    using namespace transit_presence;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load(".");

        if (const char* desired_level = std::getenv("TRANSIT_PRESENCE_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        auto logger = get_logger();
        logger->info("transit_presence simulator {}", k_version);

        auto callback_scheduler = std::make_shared<ThreadScheduler>("callbacks");
        auto delivery_scheduler = std::make_shared<ThreadScheduler>("store_delivery");
        auto io_scheduler = std::make_shared<ThreadScheduler>("presence_io");
        auto error_sink = std::make_shared<RecordingErrorSink>(std::make_shared<LoggingErrorSink>());

        const StartupResult startup = run_startup(configuration, callback_scheduler, error_sink);
        if (!startup.success) {
            logger->warn("Start-up finished with {} failed stages; continuing without the map", startup.failed_stages.size());
        }

        auto server = InMemoryPresenceStore::create(delivery_scheduler);
        const GeodeticCoordinate station{40.7527, -73.9772};
        {
            SimulatedParticipant seeker = make_participant(
                "alice", server, callback_scheduler, io_scheduler, error_sink, configuration,
                offset_coordinate(station, 270.0, k_start_separation_m / 2.0), 90.0
            );
            SimulatedParticipant provider = make_participant(
                "bob", server, callback_scheduler, io_scheduler, error_sink, configuration,
                offset_coordinate(station, 90.0, k_start_separation_m / 2.0), 270.0
            );

            seeker.session->enter_session(seeker.participant_id, ParticipantRole::Seeker, std::string{k_destination});
            provider.session->enter_session(provider.participant_id, ParticipantRole::Provider, std::string{k_destination});

            for (int tick = 0; tick < k_run_ticks && !should_terminate.load(); ++tick) {
                for (SimulatedParticipant* participant : {&seeker, &provider}) {
                    participant->position = offset_coordinate(participant->position, participant->bearing_deg, k_step_m);
                    participant->provider->emit(participant->position);
                }
                logger->info(
                    R"({{"component":"simulator","tick":{},"separation_m":{:.1f},"records":{}}})",
                    tick,
                    haversine_distance_m(seeker.position, provider.position),
                    server->record_count()
                );
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            seeker.session->exit_session();
            provider.session->exit_session();
        }

        logger->info(
            R"({{"component":"simulator","event":"finished","records_left":{},"errors":{}}})",
            server->record_count(),
            error_sink->events().size()
        );
        callback_scheduler->shutdown();
        io_scheduler->shutdown();
        delivery_scheduler->shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
