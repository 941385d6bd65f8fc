#include "transit_presence/scheduler.hpp"

#include <stdexcept>

namespace transit_presence {

TaskId TaskQueue::push(TimePoint due, Task task) {
    const TaskId task_id = next_id_++;
    const Key key{due, task_id};
    map_tasks_.emplace(key, std::move(task));
    map_keys_.emplace(task_id, key);
    return task_id;
}

bool TaskQueue::erase(TaskId task_id) {
    const auto iterator_key = map_keys_.find(task_id);
    if (iterator_key == map_keys_.end()) {
        return false;
    }
    map_tasks_.erase(iterator_key->second);
    map_keys_.erase(iterator_key);
    return true;
}

void TaskQueue::clear() {
    map_tasks_.clear();
    map_keys_.clear();
}

bool TaskQueue::empty() const noexcept {
    return map_tasks_.empty();
}

std::size_t TaskQueue::size() const noexcept {
    return map_tasks_.size();
}

TimePoint TaskQueue::next_due() const {
    if (map_tasks_.empty()) {
        throw std::logic_error("TaskQueue::next_due called on an empty queue");
    }
    return map_tasks_.begin()->first.first;
}

std::pair<TaskId, Task> TaskQueue::pop_front() {
    if (map_tasks_.empty()) {
        throw std::logic_error("TaskQueue::pop_front called on an empty queue");
    }
    auto iterator_task = map_tasks_.begin();
    const TaskId task_id = iterator_task->first.second;
    Task task = std::move(iterator_task->second);
    map_tasks_.erase(iterator_task);
    map_keys_.erase(task_id);
    return {task_id, std::move(task)};
}

ThreadScheduler::ThreadScheduler(std::string name)
    : str_name_(std::move(name)),
      logger_(get_logger()) {
    if (str_name_.empty()) {
        throw std::invalid_argument("ThreadScheduler requires a name");
    }
    worker_thread_ = std::thread(&ThreadScheduler::worker_loop, this);
    logger_->debug("Scheduler {} started", str_name_);
}

ThreadScheduler::~ThreadScheduler() {
    shutdown();
}

TimePoint ThreadScheduler::now() const {
    return SteadyClock::now();
}

TaskId ThreadScheduler::schedule_after(Duration delay, Task task) {
    const TimePoint due = SteadyClock::now() + to_steady(delay);
    TaskId task_id = k_invalid_task;
    {
        std::scoped_lock lock(mutex_);
        if (stop_requested_) {
            logger_->debug("Scheduler {} rejected task after shutdown", str_name_);
            return k_invalid_task;
        }
        task_id = queue_.push(due, std::move(task));
    }
    condition_.notify_one();
    return task_id;
}

bool ThreadScheduler::cancel(TaskId task_id) {
    std::scoped_lock lock(mutex_);
    return queue_.erase(task_id);
}

void ThreadScheduler::cancel_all() {
    std::scoped_lock lock(mutex_);
    queue_.clear();
}

std::size_t ThreadScheduler::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

void ThreadScheduler::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
        queue_.clear();
    }
    condition_.notify_all();
    if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) {
        worker_thread_.join();
    } else if (worker_thread_.joinable()) {
        worker_thread_.detach();
    }
    logger_->debug("Scheduler {} stopped", str_name_);
}

void ThreadScheduler::worker_loop() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (queue_.empty()) {
            condition_.wait(lock);
            continue;
        }
        const TimePoint due = queue_.next_due();
        if (SteadyClock::now() < due) {
            condition_.wait_until(lock, due);
            continue;
        }
        auto [task_id, task] = queue_.pop_front();
        lock.unlock();
        try {
            task();
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"scheduler","name":"{}","task":{},"error":"{}"}})",
                str_name_,
                task_id,
                exc.what()
            );
        }
        lock.lock();
    }
}

}  // namespace transit_presence
