#include "transit_presence/in_memory_presence_store.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

namespace transit_presence {

namespace {

constexpr char k_server_connection_id[] = "server";

/**
 * @brief Run @p function now and hand its outcome back as an already-satisfied future.
 */
template <typename Function>
auto run_to_future(Function&& function) -> std::future<std::invoke_result_t<Function>> {
    using Result = std::invoke_result_t<Function>;
    std::promise<Result> promise;
    try {
        if constexpr (std::is_void_v<Result>) {
            function();
            promise.set_value();
        } else {
            promise.set_value(function());
        }
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::string parent_of(const std::string& path) {
    const auto separator = path.rfind('/');
    if (separator == std::string::npos) {
        return std::string{};
    }
    return path.substr(0, separator);
}

std::string leaf_of(const std::string& path) {
    const auto separator = path.rfind('/');
    if (separator == std::string::npos) {
        return path;
    }
    return path.substr(separator + 1);
}

std::int64_t server_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string_view operation_name(StoreOperation operation) {
    switch (operation) {
        case StoreOperation::Write:
            return "write";
        case StoreOperation::Remove:
            return "remove";
        case StoreOperation::RegisterDisconnectHook:
            return "on_disconnect_remove";
        case StoreOperation::Read:
            return "read";
        case StoreOperation::Subscribe:
            return "subscribe";
    }
    return "unknown";
}

}  // namespace

std::shared_ptr<InMemoryPresenceStore> InMemoryPresenceStore::create(SchedulerPtr delivery_scheduler) {
    return std::make_shared<InMemoryPresenceStore>(ConstructionTag{}, std::move(delivery_scheduler));
}

InMemoryPresenceStore::InMemoryPresenceStore(ConstructionTag, SchedulerPtr delivery_scheduler)
    : delivery_scheduler_(std::move(delivery_scheduler)),
      logger_(get_logger()) {
    if (delivery_scheduler_ == nullptr) {
        throw std::invalid_argument("InMemoryPresenceStore requires a delivery scheduler");
    }
}

PresenceStorePtr InMemoryPresenceStore::connect(const std::string& connection_id) {
    if (connection_id.empty() || connection_id == k_server_connection_id) {
        throw std::invalid_argument("InMemoryPresenceStore connection id is invalid");
    }
    {
        std::scoped_lock lock(mutex_);
        set_offline_connections_.erase(connection_id);
    }
    logger_->debug("Store connection {} opened", connection_id);
    return std::make_shared<InMemoryStoreClient>(shared_from_this(), connection_id);
}

void InMemoryPresenceStore::disconnect(const std::string& connection_id) {
    std::vector<PendingDelivery> deliveries;
    std::vector<StoreEvent> events;
    {
        std::scoped_lock lock(mutex_);
        set_offline_connections_.insert(connection_id);

        const auto iterator_hooks = map_disconnect_hooks_.find(connection_id);
        if (iterator_hooks != map_disconnect_hooks_.end()) {
            for (const std::string& path : iterator_hooks->second) {
                if (map_records_.count(path) == 0) {
                    continue;
                }
                erase_record_locked(path, deliveries);
                record_mutation_locked(StoreOperation::Remove, path, k_server_connection_id);
                events.push_back(list_history_.back());
            }
            map_disconnect_hooks_.erase(iterator_hooks);
        }

        for (auto iterator_subscription = map_subscriptions_.begin(); iterator_subscription != map_subscriptions_.end();) {
            if (iterator_subscription->second.connection_id == connection_id) {
                iterator_subscription = map_subscriptions_.erase(iterator_subscription);
            } else {
                ++iterator_subscription;
            }
        }
        deliveries.erase(
            std::remove_if(
                deliveries.begin(),
                deliveries.end(),
                [this](const PendingDelivery& delivery) { return map_subscriptions_.count(delivery.handle) == 0; }
            ),
            deliveries.end()
        );
    }
    logger_->info(
        R"({{"component":"store","event":"disconnect","connection":"{}","hooks_fired":{}}})",
        connection_id,
        events.size()
    );
    notify_observer(events);
    dispatch(std::move(deliveries));
}

void InMemoryPresenceStore::inject_failures(
    const std::string& connection_id,
    StoreOperation operation,
    int count,
    StoreError::Cause cause
) {
    std::scoped_lock lock(mutex_);
    if (count <= 0) {
        map_failure_plans_.erase({connection_id, operation});
        return;
    }
    map_failure_plans_[{connection_id, operation}] = FailurePlan{count, cause};
}

void InMemoryPresenceStore::set_authorization_revoked(const std::string& connection_id, bool revoked) {
    std::scoped_lock lock(mutex_);
    if (revoked) {
        set_revoked_connections_.insert(connection_id);
    } else {
        set_revoked_connections_.erase(connection_id);
    }
}

std::optional<PresenceRecord> InMemoryPresenceStore::get(const std::string& path) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_record = map_records_.find(path);
    if (iterator_record == map_records_.end()) {
        return std::nullopt;
    }
    return iterator_record->second;
}

std::vector<std::string> InMemoryPresenceStore::paths() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_paths;
    list_paths.reserve(map_records_.size());
    for (const auto& [path, record] : map_records_) {
        list_paths.push_back(path);
    }
    return list_paths;
}

std::vector<std::string> InMemoryPresenceStore::paths_for(const std::string& participant_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_paths;
    for (const auto& [path, record] : map_records_) {
        if (leaf_of(path) == participant_id) {
            list_paths.push_back(path);
        }
    }
    return list_paths;
}

std::size_t InMemoryPresenceStore::record_count() const {
    std::scoped_lock lock(mutex_);
    return map_records_.size();
}

std::size_t InMemoryPresenceStore::listener_count() const {
    std::scoped_lock lock(mutex_);
    return map_subscriptions_.size();
}

std::size_t InMemoryPresenceStore::listener_count(const std::string& partition_path) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        map_subscriptions_.begin(),
        map_subscriptions_.end(),
        [&partition_path](const auto& entry) { return entry.second.path == partition_path; }
    ));
}

std::size_t InMemoryPresenceStore::disconnect_hook_count(const std::string& connection_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_hooks = map_disconnect_hooks_.find(connection_id);
    return iterator_hooks == map_disconnect_hooks_.end() ? 0 : iterator_hooks->second.size();
}

std::vector<StoreEvent> InMemoryPresenceStore::history() const {
    std::scoped_lock lock(mutex_);
    return list_history_;
}

void InMemoryPresenceStore::set_mutation_observer(std::function<void(const StoreEvent&)> observer) {
    std::scoped_lock lock(mutex_);
    mutation_observer_ = std::move(observer);
}

void InMemoryPresenceStore::apply_write(
    const std::string& connection_id,
    const std::string& path,
    const PresenceRecord& value
) {
    std::vector<PendingDelivery> deliveries;
    std::vector<StoreEvent> events;
    {
        std::scoped_lock lock(mutex_);
        check_operation_locked(connection_id, StoreOperation::Write);
        PresenceRecord stored = value;
        stored.server_timestamp_ms = server_time_ms();
        map_records_[path] = stored;
        record_mutation_locked(StoreOperation::Write, path, connection_id);
        events.push_back(list_history_.back());
        collect_deliveries_locked(path, deliveries);
    }
    notify_observer(events);
    dispatch(std::move(deliveries));
}

void InMemoryPresenceStore::apply_remove(const std::string& connection_id, const std::string& path) {
    std::vector<PendingDelivery> deliveries;
    std::vector<StoreEvent> events;
    {
        std::scoped_lock lock(mutex_);
        check_operation_locked(connection_id, StoreOperation::Remove);
        if (map_records_.count(path) == 0) {
            return;
        }
        erase_record_locked(path, deliveries);
        record_mutation_locked(StoreOperation::Remove, path, connection_id);
        events.push_back(list_history_.back());
    }
    notify_observer(events);
    dispatch(std::move(deliveries));
}

void InMemoryPresenceStore::register_hook(const std::string& connection_id, const std::string& path) {
    std::scoped_lock lock(mutex_);
    check_operation_locked(connection_id, StoreOperation::RegisterDisconnectHook);
    map_disconnect_hooks_[connection_id].insert(path);
}

std::optional<PresenceRecord> InMemoryPresenceStore::apply_read(const std::string& connection_id, const std::string& path) {
    std::scoped_lock lock(mutex_);
    check_operation_locked(connection_id, StoreOperation::Read);
    const auto iterator_record = map_records_.find(path);
    if (iterator_record == map_records_.end()) {
        return std::nullopt;
    }
    return iterator_record->second;
}

SubscriptionHandle InMemoryPresenceStore::add_subscription(
    const std::string& connection_id,
    const std::string& path,
    ChangeCallback callback
) {
    if (!callback) {
        throw std::invalid_argument("InMemoryPresenceStore subscription requires a callback");
    }
    std::vector<PendingDelivery> deliveries;
    SubscriptionHandle handle = k_invalid_subscription;
    {
        std::scoped_lock lock(mutex_);
        check_operation_locked(connection_id, StoreOperation::Subscribe);
        handle = next_subscription_++;
        map_subscriptions_.emplace(handle, Subscription{connection_id, path, std::move(callback)});
        deliveries.push_back(PendingDelivery{handle, snapshot_locked(path)});
    }
    logger_->debug("Store connection {} subscribed to {} (handle {})", connection_id, path, handle);
    dispatch(std::move(deliveries));
    return handle;
}

void InMemoryPresenceStore::remove_subscription(SubscriptionHandle handle) {
    std::scoped_lock lock(mutex_);
    map_subscriptions_.erase(handle);
}

void InMemoryPresenceStore::check_operation_locked(const std::string& connection_id, StoreOperation operation) {
    if (set_offline_connections_.count(connection_id) > 0) {
        throw StoreError(StoreError::Cause::Network, fmt::format("connection {} is offline", connection_id));
    }
    if (set_revoked_connections_.count(connection_id) > 0) {
        throw StoreError(
            StoreError::Cause::Authorization,
            fmt::format("permission denied for {} on connection {}", operation_name(operation), connection_id)
        );
    }
    const auto iterator_plan = map_failure_plans_.find({connection_id, operation});
    if (iterator_plan == map_failure_plans_.end()) {
        return;
    }
    const StoreError::Cause cause = iterator_plan->second.cause;
    if (--iterator_plan->second.remaining <= 0) {
        map_failure_plans_.erase(iterator_plan);
    }
    throw StoreError(cause, fmt::format("injected {} failure on connection {}", operation_name(operation), connection_id));
}

void InMemoryPresenceStore::record_mutation_locked(
    StoreOperation operation,
    const std::string& path,
    const std::string& connection_id
) {
    list_history_.push_back(StoreEvent{operation, path, connection_id, map_records_.size()});
}

void InMemoryPresenceStore::erase_record_locked(const std::string& path, std::vector<PendingDelivery>& deliveries) {
    map_records_.erase(path);
    collect_deliveries_locked(path, deliveries);
}

void InMemoryPresenceStore::collect_deliveries_locked(
    const std::string& record_path,
    std::vector<PendingDelivery>& deliveries
) const {
    const std::string partition = parent_of(record_path);
    for (const auto& [handle, subscription] : map_subscriptions_) {
        if (subscription.path == partition) {
            deliveries.push_back(PendingDelivery{handle, snapshot_locked(partition)});
        }
    }
}

PartitionSnapshot InMemoryPresenceStore::snapshot_locked(const std::string& partition) const {
    PartitionSnapshot snapshot{};
    snapshot.path = partition;
    const std::string prefix = partition + "/";
    for (auto iterator_record = map_records_.lower_bound(prefix);
         iterator_record != map_records_.end() && iterator_record->first.compare(0, prefix.size(), prefix) == 0;
         ++iterator_record) {
        const std::string child = iterator_record->first.substr(prefix.size());
        if (child.find('/') != std::string::npos) {
            continue;
        }
        snapshot.children.emplace_back(child, iterator_record->second);
    }
    return snapshot;
}

void InMemoryPresenceStore::dispatch(std::vector<PendingDelivery> deliveries) {
    std::weak_ptr<InMemoryPresenceStore> weak_server = weak_from_this();
    for (PendingDelivery& delivery : deliveries) {
        delivery_scheduler_->post([weak_server, delivery = std::move(delivery)]() {
            const auto server = weak_server.lock();
            if (server == nullptr) {
                return;
            }
            ChangeCallback callback;
            {
                std::scoped_lock lock(server->mutex_);
                const auto iterator_subscription = server->map_subscriptions_.find(delivery.handle);
                if (iterator_subscription == server->map_subscriptions_.end()) {
                    return;
                }
                callback = iterator_subscription->second.callback;
            }
            callback(delivery.snapshot);
        });
    }
}

void InMemoryPresenceStore::notify_observer(const std::vector<StoreEvent>& events) {
    std::function<void(const StoreEvent&)> observer;
    {
        std::scoped_lock lock(mutex_);
        observer = mutation_observer_;
    }
    if (!observer) {
        return;
    }
    for (const StoreEvent& event : events) {
        observer(event);
    }
}

InMemoryStoreClient::InMemoryStoreClient(std::shared_ptr<InMemoryPresenceStore> server, std::string connection_id)
    : server_(std::move(server)),
      str_connection_id_(std::move(connection_id)) {
    if (server_ == nullptr) {
        throw std::invalid_argument("InMemoryStoreClient requires a server");
    }
}

std::future<void> InMemoryStoreClient::write(const std::string& path, const PresenceRecord& value) {
    return run_to_future([this, &path, &value]() { server_->apply_write(str_connection_id_, path, value); });
}

std::future<void> InMemoryStoreClient::remove(const std::string& path) {
    return run_to_future([this, &path]() { server_->apply_remove(str_connection_id_, path); });
}

std::future<void> InMemoryStoreClient::on_disconnect_remove(const std::string& path) {
    return run_to_future([this, &path]() { server_->register_hook(str_connection_id_, path); });
}

std::future<std::optional<PresenceRecord>> InMemoryStoreClient::read(const std::string& path) {
    return run_to_future([this, &path]() { return server_->apply_read(str_connection_id_, path); });
}

SubscriptionHandle InMemoryStoreClient::subscribe(const std::string& path, ChangeCallback on_change) {
    return server_->add_subscription(str_connection_id_, path, std::move(on_change));
}

void InMemoryStoreClient::unsubscribe(SubscriptionHandle handle) {
    server_->remove_subscription(handle);
}

const std::string& InMemoryStoreClient::connection_id() const noexcept {
    return str_connection_id_;
}

}  // namespace transit_presence
