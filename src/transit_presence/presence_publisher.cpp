#include "transit_presence/presence_publisher.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "transit_presence/geodesy.hpp"

namespace transit_presence {

namespace {

std::future<void> failed_future(std::exception_ptr error) {
    std::promise<void> failed;
    failed.set_exception(std::move(error));
    return failed.get_future();
}

}  // namespace

void validate(const PublisherConfig& config) {
    if (config.debounce_window.count() < 0.0) {
        throw std::invalid_argument("PublisherConfig.debounce_window must not be negative");
    }
    if (config.min_distance_m < 0.0) {
        throw std::invalid_argument("PublisherConfig.min_distance_m must not be negative");
    }
    if (config.settle_delay.count() < 0.0) {
        throw std::invalid_argument("PublisherConfig.settle_delay must not be negative");
    }
    if (config.retry_base_delay.count() <= 0.0) {
        throw std::invalid_argument("PublisherConfig.retry_base_delay must be positive");
    }
    if (config.max_retry_attempts < 0) {
        throw std::invalid_argument("PublisherConfig.max_retry_attempts must not be negative");
    }
    if (config.store_timeout.count() <= 0.0) {
        throw std::invalid_argument("PublisherConfig.store_timeout must be positive");
    }
}

PresencePublisher::PresencePublisher(
    PresenceStorePtr store,
    SchedulerPtr scheduler,
    ErrorSinkPtr error_sink,
    PublisherConfig config
)
    : store_(std::move(store)),
      scheduler_(std::move(scheduler)),
      error_sink_(std::move(error_sink)),
      config_(config),
      logger_(get_logger()) {
    if (store_ == nullptr || scheduler_ == nullptr || error_sink_ == nullptr) {
        throw std::invalid_argument("PresencePublisher requires a store, a scheduler and an error sink");
    }
    validate(config_);
}

PresencePublisher::~PresencePublisher() {
    lifetime_->retire();
    {
        std::scoped_lock lock(mutex_);
        ++generation_;
        cancel_tasks_locked();
        cancel_identity_retry_locked();
    }
    std::scoped_lock io_lock(io_mutex_);
    try {
        flush_stale_paths();
    } catch (const std::exception& exc) {
        logger_->warn(
            R"({{"component":"publisher","event":"stale_remove_failed","stage":"destroy","error":"{}"}})",
            exc.what()
        );
    }
}

void PresencePublisher::publish(const SessionIdentity& identity, const GeodeticCoordinate& position) {
    {
        std::scoped_lock lock(mutex_);
        if (target_ && *target_ == identity) {
            const TimePoint now = scheduler_->now();
            bool accept = !last_accepted_at_;
            if (!accept && now - *last_accepted_at_ >= to_steady(config_.debounce_window)) {
                accept = true;
            }
            if (!accept) {
                const GeodeticCoordinate reference =
                    last_written_position_ ? *last_written_position_ : *last_accepted_position_;
                accept = haversine_distance_m(reference, position) >= config_.min_distance_m;
            }
            if (!accept) {
                logger_->trace("Debounced fix for {}", describe(identity));
                return;
            }

            last_accepted_at_ = now;
            last_accepted_position_ = position;
            cancel_tasks_locked();
            const std::uint64_t generation = generation_;
            settle_task_ = scheduler_->schedule_after(config_.settle_delay, guarded([this, generation, identity, position]() {
                write_attempt(generation, identity, position, 1);
            }));
            return;
        }
    }
    report(
        ErrorKind::ValidationError,
        fmt::format("fix for {} is not the current write target", describe(identity)),
        record_path(identity)
    );
}

std::future<void> PresencePublisher::set_identity(const SessionIdentity& identity) {
    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> completion = promise->get_future();

    std::scoped_lock lock(mutex_);
    const std::optional<SessionIdentity> previous = target_;
    target_ = identity;
    ++generation_;
    cancel_tasks_locked();
    cancel_identity_retry_locked();
    reset_debounce_locked();
    if (previous && !(*previous == identity)) {
        set_stale_paths_.insert(record_path(*previous));
    }
    set_stale_paths_.erase(record_path(identity));

    const TaskId task_id = scheduler_->post(guarded([this, identity, promise]() {
        apply_identity_change(identity, 1, promise);
    }));
    if (task_id == k_invalid_task) {
        promise->set_exception(std::make_exception_ptr(
            PresenceError(ErrorKind::ValidationError, "publisher scheduler is shut down")
        ));
    }
    logger_->info(
        R"({{"component":"publisher","event":"identity","previous":"{}","current":"{}"}})",
        previous ? record_path(*previous) : std::string{},
        record_path(identity)
    );
    return completion;
}

std::future<void> PresencePublisher::remove(const SessionIdentity& identity) {
    {
        std::scoped_lock lock(mutex_);
        ++generation_;
        cancel_tasks_locked();
        cancel_identity_retry_locked();
        if (target_ && *target_ == identity) {
            target_.reset();
            reset_debounce_locked();
        }
    }

    const std::string path = record_path(identity);
    std::scoped_lock io_lock(io_mutex_);
    logger_->info(R"({{"component":"publisher","event":"remove","path":"{}"}})", path);

    std::exception_ptr stale_error;
    try {
        flush_stale_paths();
    } catch (const std::exception& exc) {
        stale_error = std::current_exception();
        logger_->warn(
            R"({{"component":"publisher","event":"stale_remove_failed","stage":"remove","error":"{}"}})",
            exc.what()
        );
    }

    std::future<void> removal;
    try {
        removal = store_->remove(path);
    } catch (const std::exception& exc) {
        report(classify(std::current_exception()), exc.what(), path);
        return failed_future(std::current_exception());
    }
    if (!stale_error) {
        return removal;
    }
    try {
        await_store(std::move(removal), "remove");
    } catch (const std::exception&) {
        return failed_future(std::current_exception());
    }
    return failed_future(stale_error);
}

void PresencePublisher::cancel_pending() {
    std::scoped_lock lock(mutex_);
    ++generation_;
    cancel_tasks_locked();
    last_accepted_at_.reset();
    logger_->debug("Publisher pending writes cancelled");
}

void PresencePublisher::set_foreground(bool foreground) {
    std::scoped_lock lock(mutex_);
    foreground_ = foreground;
}

std::optional<SessionIdentity> PresencePublisher::identity() const {
    std::scoped_lock lock(mutex_);
    return target_;
}

std::optional<GeodeticCoordinate> PresencePublisher::last_written_position() const {
    std::scoped_lock lock(mutex_);
    return last_written_position_;
}

std::uint64_t PresencePublisher::writes_issued() const {
    std::scoped_lock lock(mutex_);
    return writes_issued_;
}

bool PresencePublisher::has_pending_write() const {
    std::scoped_lock lock(mutex_);
    return settle_task_ != k_invalid_task || retry_task_ != k_invalid_task;
}

std::set<std::string> PresencePublisher::stale_paths() const {
    std::scoped_lock lock(mutex_);
    return set_stale_paths_;
}

void PresencePublisher::write_attempt(
    std::uint64_t generation,
    const SessionIdentity& identity,
    const GeodeticCoordinate& position,
    int attempt
) {
    {
        std::scoped_lock lock(mutex_);
        if (generation != generation_) {
            return;
        }
        settle_task_ = k_invalid_task;
        retry_task_ = k_invalid_task;
    }

    std::scoped_lock io_lock(io_mutex_);
    {
        std::scoped_lock lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ++writes_issued_;
    }

    const std::string path = record_path(identity);
    PresenceRecord record{};
    record.latitude = position.latitude_deg;
    record.longitude = position.longitude_deg;
    record.role = identity.role;
    record.destination = identity.destination;
    try {
        flush_stale_paths();
        await_store(store_->write(path, record), "write");
    } catch (const std::exception&) {
        handle_write_failure(generation, identity, position, attempt, std::current_exception());
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        if (generation == generation_) {
            last_written_position_ = position;
        }
    }
    logger_->debug(
        R"({{"component":"publisher","event":"write","path":"{}","lat":{:.6f},"lon":{:.6f},"attempt":{}}})",
        path,
        position.latitude_deg,
        position.longitude_deg,
        attempt
    );
}

void PresencePublisher::handle_write_failure(
    std::uint64_t generation,
    const SessionIdentity& identity,
    const GeodeticCoordinate& position,
    int attempt,
    std::exception_ptr error
) {
    const ErrorKind kind = classify(error);
    const std::string path = record_path(identity);
    const std::string message = describe(error);
    logger_->warn(
        R"({{"component":"publisher","event":"write_failed","path":"{}","attempt":{},"kind":"{}","error":"{}"}})",
        path,
        attempt,
        error_kind_name(kind),
        message
    );

    if (!is_retryable(kind)) {
        report(kind, message, path);
        return;
    }

    std::scoped_lock lock(mutex_);
    if (generation != generation_) {
        return;
    }
    if (!foreground_) {
        logger_->info("Dropping failed write for {} while in background", path);
        return;
    }
    if (attempt > config_.max_retry_attempts) {
        report(kind, fmt::format("write abandoned after {} retries: {}", config_.max_retry_attempts, message), path);
        return;
    }
    const Duration delay = config_.retry_base_delay * std::pow(2.0, attempt - 1);
    retry_task_ = scheduler_->schedule_after(delay, guarded([this, generation, identity, position, attempt]() {
        write_attempt(generation, identity, position, attempt + 1);
    }));
    logger_->info("Retrying write for {} in {:.2f}s (retry {} of {})", path, delay.count(), attempt, config_.max_retry_attempts);
}

void PresencePublisher::apply_identity_change(
    const SessionIdentity& identity,
    int attempt,
    std::shared_ptr<std::promise<void>> completion
) {
    {
        std::scoped_lock lock(mutex_);
        if (attempt > 1) {
            identity_retry_task_ = k_invalid_task;
            if (!target_ || !(*target_ == identity)) {
                return;
            }
        }
    }

    try {
        std::scoped_lock io_lock(io_mutex_);
        flush_stale_paths();
        await_store(store_->on_disconnect_remove(record_path(identity)), "on_disconnect_remove");
    } catch (const std::exception& exc) {
        const std::exception_ptr error = std::current_exception();
        if (completion != nullptr) {
            completion->set_exception(error);
        }
        schedule_identity_retry(identity, attempt, classify(error), exc.what());
        return;
    }
    if (completion != nullptr) {
        completion->set_value();
    }
    if (attempt > 1) {
        logger_->info(R"({{"component":"publisher","event":"identity_settled","path":"{}","attempt":{}}})", record_path(identity), attempt);
    }
}

void PresencePublisher::schedule_identity_retry(
    const SessionIdentity& identity,
    int attempt,
    ErrorKind kind,
    const std::string& message
) {
    const std::string path = record_path(identity);
    logger_->warn(
        R"({{"component":"publisher","event":"identity_failed","path":"{}","attempt":{},"kind":"{}","error":"{}"}})",
        path,
        attempt,
        error_kind_name(kind),
        message
    );
    if (!is_retryable(kind)) {
        report(kind, message, path);
        return;
    }

    std::scoped_lock lock(mutex_);
    if (!target_ || !(*target_ == identity)) {
        return;
    }
    if (attempt > config_.max_retry_attempts) {
        report(kind, fmt::format("identity change abandoned after {} retries: {}", config_.max_retry_attempts, message), path);
        return;
    }
    const Duration delay = config_.retry_base_delay * std::pow(2.0, attempt - 1);
    identity_retry_task_ = scheduler_->schedule_after(delay, guarded([this, identity, attempt]() {
        apply_identity_change(identity, attempt + 1, nullptr);
    }));
    logger_->info("Retrying identity change for {} in {:.2f}s (retry {} of {})", path, delay.count(), attempt, config_.max_retry_attempts);
}

void PresencePublisher::flush_stale_paths() {
    std::vector<std::string> list_paths;
    {
        std::scoped_lock lock(mutex_);
        list_paths.assign(set_stale_paths_.begin(), set_stale_paths_.end());
    }
    for (const std::string& path : list_paths) {
        await_store(store_->remove(path), "remove");
        {
            std::scoped_lock lock(mutex_);
            set_stale_paths_.erase(path);
        }
        logger_->info(R"({{"component":"publisher","event":"removed_previous","path":"{}"}})", path);
    }
}

void PresencePublisher::await_store(std::future<void> acknowledgement, const std::string& operation) {
    if (acknowledgement.wait_for(to_steady(config_.store_timeout)) != std::future_status::ready) {
        throw StoreError(
            StoreError::Cause::Network,
            fmt::format("{} not acknowledged within {}s", operation, config_.store_timeout.count())
        );
    }
    acknowledgement.get();
}

void PresencePublisher::cancel_tasks_locked() {
    if (settle_task_ != k_invalid_task) {
        scheduler_->cancel(settle_task_);
        settle_task_ = k_invalid_task;
    }
    if (retry_task_ != k_invalid_task) {
        scheduler_->cancel(retry_task_);
        retry_task_ = k_invalid_task;
    }
}

void PresencePublisher::cancel_identity_retry_locked() {
    if (identity_retry_task_ != k_invalid_task) {
        scheduler_->cancel(identity_retry_task_);
        identity_retry_task_ = k_invalid_task;
    }
}

void PresencePublisher::reset_debounce_locked() {
    last_accepted_at_.reset();
    last_accepted_position_.reset();
    last_written_position_.reset();
}

void PresencePublisher::report(ErrorKind kind, const std::string& message, const std::string& context) {
    error_sink_->report(ErrorEvent{kind, message, context});
}

}  // namespace transit_presence
