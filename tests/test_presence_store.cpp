#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_scheduler.hpp"
#include "transit_presence/in_memory_presence_store.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

PresenceRecord make_record(double latitude, double longitude) {
    PresenceRecord record{};
    record.latitude = latitude;
    record.longitude = longitude;
    record.role = ParticipantRole::Seeker;
    record.destination = "harbour";
    return record;
}
}  // namespace

TEST_CASE("InMemoryPresenceStore writes, reads and removes records") {
    auto scheduler = std::make_shared<test::ManualScheduler>();
    auto server = InMemoryPresenceStore::create(scheduler);
    auto client = server->connect("alice");

    client->write("seekers/harbour/alice", make_record(1.0, 2.0)).get();
    const auto stored = server->get("seekers/harbour/alice");
    REQUIRE(stored.has_value());
    REQUIRE(stored->server_timestamp_ms > 0);
    REQUIRE(client->read("seekers/harbour/alice").get()->position() == GeodeticCoordinate{1.0, 2.0});
    REQUIRE(server->paths_for("alice") == std::vector<std::string>{"seekers/harbour/alice"});

    client->remove("seekers/harbour/alice").get();
    REQUIRE(server->record_count() == 0);
    REQUIRE_NOTHROW(client->remove("seekers/harbour/alice").get());
    REQUIRE_FALSE(client->read("seekers/harbour/alice").get().has_value());
}

TEST_CASE("Subscriptions deliver the initial snapshot and every change of direct children") {
    auto scheduler = std::make_shared<test::ManualScheduler>();
    auto server = InMemoryPresenceStore::create(scheduler);
    auto watcher = server->connect("watcher");
    auto writer = server->connect("writer");

    std::vector<PartitionSnapshot> snapshots;
    const SubscriptionHandle handle = watcher->subscribe("seekers/harbour", [&](const PartitionSnapshot& snapshot) {
        snapshots.push_back(snapshot);
    });
    REQUIRE(handle != k_invalid_subscription);
    REQUIRE(snapshots.empty());

    scheduler->run_pending();
    REQUIRE(snapshots.size() == 1);
    REQUIRE(snapshots.back().children.empty());

    writer->write("seekers/harbour/bob", make_record(0.0, 0.0)).get();
    writer->write("seekers/airport/bob", make_record(0.0, 0.0)).get();
    scheduler->run_pending();
    REQUIRE(snapshots.size() == 2);
    REQUIRE(snapshots.back().children.size() == 1);
    REQUIRE(snapshots.back().children.front().first == "bob");

    watcher->unsubscribe(handle);
    writer->remove("seekers/harbour/bob").get();
    scheduler->run_pending();
    REQUIRE(snapshots.size() == 2);
    REQUIRE(server->listener_count() == 0);
}

TEST_CASE("An ungraceful disconnect fires the connection's hooks only") {
    auto scheduler = std::make_shared<test::ManualScheduler>();
    auto server = InMemoryPresenceStore::create(scheduler);
    auto alice = server->connect("alice");
    auto bob = server->connect("bob");

    alice->write("seekers/harbour/alice", make_record(0.0, 0.0)).get();
    alice->on_disconnect_remove("seekers/harbour/alice").get();
    bob->write("providers/harbour/bob", make_record(0.0, 0.0)).get();
    bob->on_disconnect_remove("providers/harbour/bob").get();
    REQUIRE(server->disconnect_hook_count("alice") == 1);

    server->disconnect("alice");

    REQUIRE(server->paths() == std::vector<std::string>{"providers/harbour/bob"});
    const auto history = server->history();
    REQUIRE(history.back().operation == StoreOperation::Remove);
    REQUIRE(history.back().connection_id == "server");
    REQUIRE_THROWS_AS(alice->write("seekers/harbour/alice", make_record(0.0, 0.0)).get(), StoreError);

    auto reconnected = server->connect("alice");
    REQUIRE_NOTHROW(reconnected->write("seekers/harbour/alice", make_record(0.0, 0.0)).get());
}

TEST_CASE("Injected failures and revoked authorization surface through the futures") {
    auto scheduler = std::make_shared<test::ManualScheduler>();
    auto server = InMemoryPresenceStore::create(scheduler);
    auto client = server->connect("alice");

    server->inject_failures("alice", StoreOperation::Write, 2, StoreError::Cause::Network);
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            client->write("seekers/harbour/alice", make_record(0.0, 0.0)).get();
            FAIL("write should have failed");
        } catch (const StoreError& error) {
            REQUIRE(error.cause() == StoreError::Cause::Network);
        }
    }
    REQUIRE_NOTHROW(client->write("seekers/harbour/alice", make_record(0.0, 0.0)).get());

    server->set_authorization_revoked("alice", true);
    try {
        client->remove("seekers/harbour/alice").get();
        FAIL("remove should have been refused");
    } catch (const StoreError& error) {
        REQUIRE(error.is_authorization());
    }
    REQUIRE_THROWS_AS(client->subscribe("providers/harbour", [](const PartitionSnapshot&) {}), StoreError);
    server->set_authorization_revoked("alice", false);
    REQUIRE(server->record_count() == 1);
}
