// === Scheduler ===============================================================
//
// Serialized timer queue used for every piece of timed work in the subsystem
// (publisher settle delays, retry backoff, callback-context delivery). Tasks
// run one at a time in due-time order, ties broken by submission order, so
// work submitted through one scheduler is never reordered. Every task gets a
// handle that can be cancelled until the task starts running.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "transit_presence/logging.hpp"
#include "transit_presence/types.hpp"

namespace transit_presence {

using TaskId = std::uint64_t;
using Task = std::function<void()>;

/** @brief Handle value never returned for a live task. */
inline constexpr TaskId k_invalid_task{0};

/** @brief Abstract serialized timer queue. */
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /** @brief Current time according to this scheduler's clock. */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /** @brief Run @p task once @p delay has elapsed. */
    virtual TaskId schedule_after(Duration delay, Task task) = 0;

    /** @brief Run @p task as soon as possible, after already-due work. */
    TaskId post(Task task) {
        return schedule_after(Duration{0.0}, std::move(task));
    }

    /** @brief Cancel a task that has not started. Returns false if it already ran or was unknown. */
    virtual bool cancel(TaskId task_id) = 0;

    /** @brief Drop every pending task. */
    virtual void cancel_all() = 0;

    /** @brief Number of tasks waiting to run. */
    [[nodiscard]] virtual std::size_t pending() const = 0;
};

using SchedulerPtr = std::shared_ptr<Scheduler>;

/**
 * @brief Ordered task storage shared by the concrete schedulers.
 *
 * Not thread-safe on its own; callers hold their own mutex.
 */
class TaskQueue final {
  public:
    TaskId push(TimePoint due, Task task);
    bool erase(TaskId task_id);
    void clear();

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    /** @brief Due time of the earliest task; queue must not be empty. */
    [[nodiscard]] TimePoint next_due() const;
    /** @brief Remove and return the earliest task; queue must not be empty. */
    std::pair<TaskId, Task> pop_front();

  private:
    using Key = std::pair<TimePoint, TaskId>;

    TaskId next_id_{1};
    std::map<Key, Task> map_tasks_;
    std::unordered_map<TaskId, Key> map_keys_;
};

/**
 * @brief Runs tasks on a dedicated worker thread against the steady clock.
 */
class ThreadScheduler final : public Scheduler {
  public:
    explicit ThreadScheduler(std::string name);
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    [[nodiscard]] TimePoint now() const override;
    TaskId schedule_after(Duration delay, Task task) override;
    bool cancel(TaskId task_id) override;
    void cancel_all() override;
    [[nodiscard]] std::size_t pending() const override;

    /** @brief Drop pending tasks and join the worker. Idempotent. */
    void shutdown();

  private:
    void worker_loop();

    std::string str_name_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    TaskQueue queue_;
    bool stop_requested_{false};
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace transit_presence
