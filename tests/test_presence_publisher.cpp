#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_scheduler.hpp"
#include "transit_presence/geodesy.hpp"
#include "transit_presence/in_memory_presence_store.hpp"
#include "transit_presence/presence_publisher.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

const GeodeticCoordinate k_origin{-33.8568, 151.2153};

struct PublisherHarness final {
    std::shared_ptr<test::ManualScheduler> scheduler{std::make_shared<test::ManualScheduler>()};
    std::shared_ptr<InMemoryPresenceStore> server{InMemoryPresenceStore::create(scheduler)};
    std::shared_ptr<RecordingErrorSink> errors{std::make_shared<RecordingErrorSink>()};
    PresencePublisher publisher{server->connect("alice"), scheduler, errors};
    SessionIdentity identity{"alice", ParticipantRole::Seeker, "opera_house"};

    PublisherHarness() {
        publisher.set_identity(identity);
        scheduler->run_pending();
    }
};
}  // namespace

TEST_CASE("PresencePublisher registers the disconnect hook when the identity is set") {
    PublisherHarness harness{};
    REQUIRE(harness.server->disconnect_hook_count("alice") == 1);

    std::future<void> done = harness.publisher.set_identity(SessionIdentity{"alice", ParticipantRole::Provider, "opera_house"});
    REQUIRE(done.wait_for(std::chrono::seconds(0)) == std::future_status::timeout);
    harness.scheduler->run_pending();
    REQUIRE_NOTHROW(done.get());
    REQUIRE(harness.server->disconnect_hook_count("alice") == 2);
}

TEST_CASE("PresencePublisher coalesces over the settle delay and debounces by time or distance") {
    PublisherHarness harness{};

    harness.publisher.publish(harness.identity, k_origin);
    REQUIRE(harness.publisher.has_pending_write());
    harness.scheduler->advance(Duration{0.5});
    REQUIRE(harness.server->record_count() == 0);
    harness.scheduler->advance(Duration{0.5});
    REQUIRE(harness.server->get("seekers/opera_house/alice")->position() == k_origin);
    REQUIRE(harness.publisher.writes_issued() == 1);

    harness.publisher.publish(harness.identity, offset_coordinate(k_origin, 45.0, 3.0));
    harness.scheduler->advance(Duration{2.0});
    REQUIRE(harness.publisher.writes_issued() == 1);

    const GeodeticCoordinate moved = offset_coordinate(k_origin, 45.0, 15.0);
    harness.publisher.publish(harness.identity, moved);
    harness.scheduler->advance(Duration{1.0});
    REQUIRE(harness.publisher.writes_issued() == 2);
    REQUIRE(harness.publisher.last_written_position() == moved);

    harness.scheduler->advance(Duration{5.0});
    harness.publisher.publish(harness.identity, moved);
    harness.scheduler->advance(Duration{1.0});
    REQUIRE(harness.publisher.writes_issued() == 3);
}

TEST_CASE("PresencePublisher keeps only the latest fix inside the settle window") {
    PublisherHarness harness{};
    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{0.5});
    const GeodeticCoordinate latest = offset_coordinate(k_origin, 0.0, 40.0);
    harness.publisher.publish(harness.identity, latest);
    harness.scheduler->advance(Duration{1.0});

    REQUIRE(harness.publisher.writes_issued() == 1);
    REQUIRE(harness.server->get("seekers/opera_house/alice")->position() == latest);
}

TEST_CASE("PresencePublisher rejects fixes for a stale identity") {
    PublisherHarness harness{};
    harness.publisher.publish(SessionIdentity{"alice", ParticipantRole::Seeker, "elsewhere"}, k_origin);
    harness.scheduler->advance(Duration{2.0});

    REQUIRE(harness.server->record_count() == 0);
    REQUIRE(harness.errors->count(ErrorKind::ValidationError) == 1);
}

TEST_CASE("PresencePublisher removes the previous record before writing under a new identity") {
    PublisherHarness harness{};
    std::vector<StoreEvent> mutations;
    harness.server->set_mutation_observer([&mutations](const StoreEvent& event) { mutations.push_back(event); });

    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{1.0});

    const SessionIdentity moved{"alice", ParticipantRole::Seeker, "central"};
    harness.publisher.set_identity(moved);
    harness.publisher.publish(moved, k_origin);
    harness.scheduler->advance(Duration{1.0});

    REQUIRE(mutations.size() == 3);
    REQUIRE(mutations[1].operation == StoreOperation::Remove);
    REQUIRE(mutations[1].path == "seekers/opera_house/alice");
    REQUIRE(mutations[2].operation == StoreOperation::Write);
    REQUIRE(mutations[2].path == "seekers/central/alice");
    for (const StoreEvent& event : mutations) {
        REQUIRE(event.record_count_after <= 1);
    }
    REQUIRE(harness.server->paths_for("alice") == std::vector<std::string>{"seekers/central/alice"});
}

TEST_CASE("PresencePublisher retries a failed removal of the previous record before writing the new one") {
    PublisherHarness harness{};
    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{1.0});
    REQUIRE(harness.server->record_count() == 1);

    std::vector<StoreEvent> mutations;
    harness.server->set_mutation_observer([&mutations](const StoreEvent& event) { mutations.push_back(event); });
    harness.server->inject_failures("alice", StoreOperation::Remove, 2, StoreError::Cause::Network);

    const SessionIdentity moved{"alice", ParticipantRole::Seeker, "central"};
    std::future<void> done = harness.publisher.set_identity(moved);
    harness.publisher.publish(moved, k_origin);
    harness.scheduler->run_pending();
    REQUIRE_THROWS_AS(done.get(), StoreError);
    REQUIRE(harness.publisher.stale_paths() == std::set<std::string>{"seekers/opera_house/alice"});

    harness.scheduler->advance(Duration{0.9});
    REQUIRE(harness.server->paths_for("alice") == std::vector<std::string>{"seekers/opera_house/alice"});

    harness.scheduler->advance(Duration{5.0});
    REQUIRE(harness.server->paths_for("alice") == std::vector<std::string>{"seekers/central/alice"});
    REQUIRE(harness.publisher.stale_paths().empty());
    REQUIRE(harness.errors->events().empty());
    for (const StoreEvent& event : mutations) {
        REQUIRE(event.record_count_after <= 1);
    }
    harness.server->set_mutation_observer(nullptr);
}

TEST_CASE("PresencePublisher holds writes for the new identity while the previous record cannot be removed") {
    PublisherHarness harness{};
    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{1.0});

    harness.server->inject_failures("alice", StoreOperation::Remove, 100, StoreError::Cause::Network);
    const SessionIdentity moved{"alice", ParticipantRole::Seeker, "central"};
    harness.publisher.set_identity(moved);
    harness.publisher.publish(moved, k_origin);
    harness.scheduler->advance(Duration{30.0});

    REQUIRE(harness.server->paths_for("alice") == std::vector<std::string>{"seekers/opera_house/alice"});
    REQUIRE(harness.publisher.stale_paths().size() == 1);
    REQUIRE(harness.errors->count(ErrorKind::NetworkError) == 2);

    harness.server->inject_failures("alice", StoreOperation::Remove, 0, StoreError::Cause::Network);
    harness.publisher.publish(moved, k_origin);
    harness.scheduler->advance(Duration{1.0});
    REQUIRE(harness.server->paths_for("alice") == std::vector<std::string>{"seekers/central/alice"});
}

TEST_CASE("PresencePublisher retries network failures with exponential backoff") {
    PublisherHarness harness{};

    SECTION("recovers within the retry budget") {
        harness.server->inject_failures("alice", StoreOperation::Write, 2, StoreError::Cause::Network);
        harness.publisher.publish(harness.identity, k_origin);
        harness.scheduler->advance(Duration{1.0});
        REQUIRE(harness.publisher.writes_issued() == 1);
        harness.scheduler->advance(Duration{0.5});
        REQUIRE(harness.publisher.writes_issued() == 2);
        harness.scheduler->advance(Duration{0.9});
        REQUIRE(harness.publisher.writes_issued() == 2);
        harness.scheduler->advance(Duration{0.1});
        REQUIRE(harness.publisher.writes_issued() == 3);
        REQUIRE(harness.server->record_count() == 1);
        REQUIRE(harness.errors->events().empty());
    }

    SECTION("reports once the retries are exhausted") {
        harness.server->inject_failures("alice", StoreOperation::Write, 100, StoreError::Cause::Network);
        harness.publisher.publish(harness.identity, k_origin);
        harness.scheduler->advance(Duration{30.0});
        REQUIRE(harness.publisher.writes_issued() == 4);
        REQUIRE(harness.errors->count(ErrorKind::NetworkError) == 1);
        REQUIRE_FALSE(harness.publisher.has_pending_write());
    }

    SECTION("drops failed writes while in the background") {
        harness.publisher.set_foreground(false);
        harness.server->inject_failures("alice", StoreOperation::Write, 1, StoreError::Cause::Network);
        harness.publisher.publish(harness.identity, k_origin);
        harness.scheduler->advance(Duration{10.0});
        REQUIRE(harness.publisher.writes_issued() == 1);
        REQUIRE(harness.server->record_count() == 0);
        REQUIRE(harness.errors->events().empty());
    }

    SECTION("does not retry authorization failures") {
        harness.server->set_authorization_revoked("alice", true);
        harness.publisher.publish(harness.identity, k_origin);
        harness.scheduler->advance(Duration{10.0});
        REQUIRE(harness.publisher.writes_issued() == 1);
        REQUIRE(harness.errors->count(ErrorKind::AuthorizationError) == 1);
    }
}

TEST_CASE("PresencePublisher remove cancels pending writes and deletes the record") {
    PublisherHarness harness{};
    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{1.0});
    REQUIRE(harness.server->record_count() == 1);

    harness.publisher.publish(harness.identity, offset_coordinate(k_origin, 90.0, 50.0));
    REQUIRE_NOTHROW(harness.publisher.remove(harness.identity).get());
    harness.scheduler->advance(Duration{5.0});

    REQUIRE(harness.server->record_count() == 0);
    REQUIRE_FALSE(harness.publisher.identity().has_value());
    REQUIRE(harness.publisher.writes_issued() == 1);
}

TEST_CASE("PresencePublisher remove also deletes a previous record still queued for removal") {
    PublisherHarness harness{};
    harness.publisher.publish(harness.identity, k_origin);
    harness.scheduler->advance(Duration{1.0});

    const SessionIdentity moved{"alice", ParticipantRole::Seeker, "central"};
    harness.publisher.set_identity(moved);

    SECTION("removal succeeds") {
        REQUIRE_NOTHROW(harness.publisher.remove(moved).get());
        REQUIRE(harness.server->record_count() == 0);
        REQUIRE(harness.publisher.stale_paths().empty());
    }

    SECTION("previous record cannot be removed") {
        harness.server->inject_failures("alice", StoreOperation::Remove, 1, StoreError::Cause::Network);
        REQUIRE_THROWS_AS(harness.publisher.remove(moved).get(), StoreError);
        REQUIRE(harness.publisher.stale_paths().size() == 1);
    }

    harness.scheduler->advance(Duration{5.0});
    REQUIRE(harness.publisher.writes_issued() == 1);
}

TEST_CASE("PresencePublisher destroyed before its identity change runs still removes the previous record") {
    auto scheduler = std::make_shared<test::ManualScheduler>();
    auto server = InMemoryPresenceStore::create(scheduler);
    auto errors = std::make_shared<RecordingErrorSink>();
    auto publisher = std::make_unique<PresencePublisher>(server->connect("alice"), scheduler, errors);
    const SessionIdentity first{"alice", ParticipantRole::Provider, "opera_house"};

    publisher->set_identity(first);
    scheduler->run_pending();
    publisher->publish(first, k_origin);
    scheduler->advance(Duration{1.0});
    REQUIRE(server->record_count() == 1);

    publisher->set_identity(SessionIdentity{"alice", ParticipantRole::Provider, "central"});
    REQUIRE(scheduler->pending() == 1);
    publisher.reset();
    REQUIRE(server->record_count() == 0);

    // The queued identity task outlives the publisher and must not touch it.
    scheduler->advance(Duration{5.0});
    REQUIRE(server->record_count() == 0);
    REQUIRE(server->disconnect_hook_count("alice") == 1);
}

TEST_CASE("PresencePublisher config validation") {
    PublisherConfig config{};
    config.retry_base_delay = Duration{0.0};
    REQUIRE_THROWS_AS(validate(config), std::invalid_argument);
    config = PublisherConfig{};
    config.max_retry_attempts = -1;
    REQUIRE_THROWS_AS(validate(config), std::invalid_argument);
}
