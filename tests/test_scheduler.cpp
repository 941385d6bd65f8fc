#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_scheduler.hpp"
#include "transit_presence/cancellation.hpp"
#include "transit_presence/scheduler.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("ThreadScheduler runs tasks in due order and skips cancelled ones") {
    ThreadScheduler scheduler{"test"};
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    scheduler.schedule_after(Duration{0.5}, [&]() {
        std::scoped_lock lock(mutex);
        order.push_back(3);
        done.set_value();
    });
    const TaskId cancelled = scheduler.schedule_after(Duration{0.4}, [&]() {
        std::scoped_lock lock(mutex);
        order.push_back(99);
    });
    scheduler.schedule_after(Duration{0.02}, [&]() {
        std::scoped_lock lock(mutex);
        order.push_back(2);
    });
    scheduler.post([&]() {
        std::scoped_lock lock(mutex);
        order.push_back(1);
    });
    REQUIRE(scheduler.cancel(cancelled));

    REQUIRE(done.get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    std::scoped_lock lock(mutex);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("ThreadScheduler survives throwing tasks and rejects work after shutdown") {
    ThreadScheduler scheduler{"test"};
    std::promise<void> done;
    scheduler.post([]() { throw std::runtime_error("task failure"); });
    scheduler.post([&done]() { done.set_value(); });
    REQUIRE(done.get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);

    scheduler.shutdown();
    REQUIRE(scheduler.post([]() {}) == k_invalid_task);
    REQUIRE(scheduler.pending() == 0);
}

TEST_CASE("ManualScheduler only runs tasks when time advances") {
    test::ManualScheduler scheduler{};
    std::vector<int> order;

    scheduler.schedule_after(Duration{2.0}, [&]() { order.push_back(2); });
    scheduler.schedule_after(Duration{1.0}, [&]() {
        order.push_back(1);
        scheduler.schedule_after(Duration{0.5}, [&]() { order.push_back(15); });
    });

    REQUIRE(scheduler.run_pending() == 0);
    REQUIRE(scheduler.advance(Duration{1.0}) == 1);
    REQUIRE(scheduler.advance(Duration{1.0}) == 2);
    REQUIRE(order == std::vector<int>{1, 15, 2});
    REQUIRE(scheduler.pending() == 0);
}

TEST_CASE("CancellationToken wakes a sleeper early") {
    CancellationToken token{};
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    const auto started = SteadyClock::now();
    REQUIRE(token.wait_for(Duration{5.0}));
    REQUIRE(SteadyClock::now() - started < std::chrono::seconds(2));
    canceller.join();
    REQUIRE(token.cancelled());
}
