#include "transit_presence/presence_session.hpp"

#include <array>
#include <stdexcept>

#include <fmt/format.h>

namespace transit_presence {

namespace {

constexpr std::array<ParticipantRole, 2> k_all_roles{ParticipantRole::Seeker, ParticipantRole::Provider};

bool is_terminal(ErrorKind kind) noexcept {
    return kind == ErrorKind::PermissionDenied || kind == ErrorKind::AuthorizationError
        || kind == ErrorKind::InvariantViolation;
}

}  // namespace

std::string_view availability_name(SessionAvailability availability) noexcept {
    switch (availability) {
        case SessionAvailability::NotAvailable:
            return "not_available";
        case SessionAvailability::Available:
            return "available";
        case SessionAvailability::Error:
            return "error";
    }
    return "unknown";
}

PresenceSession::ErrorRelay::ErrorRelay(PresenceSession& session, ErrorSinkPtr downstream)
    : session_(session),
      downstream_(std::move(downstream)) {
    if (downstream_ == nullptr) {
        throw std::invalid_argument("PresenceSession requires an error sink");
    }
}

void PresenceSession::ErrorRelay::report(const ErrorEvent& event) {
    downstream_->report(event);
    session_.on_error(event);
}

PresenceSession::PresenceSession(
    PresenceStorePtr store,
    LocationProviderPtr provider,
    PowerStatusSourcePtr power_source,
    SchedulerPtr callback_context,
    SchedulerPtr io_context,
    ErrorSinkPtr error_sink,
    PresenceSessionSettings settings
)
    : store_(store),
      callback_context_(callback_context),
      config_(settings.session),
      logger_(get_logger()),
      error_relay_(std::make_shared<ErrorRelay>(*this, std::move(error_sink))),
      acquisition_(std::move(provider), std::move(power_source), callback_context, error_relay_, settings.acquisition),
      publisher_(store, std::move(io_context), error_relay_, settings.publisher),
      discovery_(store, error_relay_, settings.discovery) {
    if (store_ == nullptr || callback_context_ == nullptr) {
        throw std::invalid_argument("PresenceSession requires a store and a callback context");
    }
    if (config_.consumer_id.empty() || config_.location_interval.count() <= 0.0 || config_.teardown_timeout.count() <= 0.0) {
        throw std::invalid_argument("SessionConfig requires a consumer id and positive durations");
    }

    fix_listener_ = acquisition_.add_fix_listener([this](const LocationFix& fix) { on_fix(fix); });
    discovery_.set_notification_sink([this](const ProximityNotification& notification) {
        NotificationSink sink;
        {
            std::scoped_lock lock(mutex_);
            sink = notification_sink_;
        }
        if (sink) {
            callback_context_->post([sink, notification]() { sink(notification); });
        }
    });
    discovery_.set_snapshot_observer([this](const DiscoverySnapshot&) { notify_observer(); });
}

PresenceSession::~PresenceSession() {
    shutdown();
    acquisition_.remove_fix_listener(fix_listener_);
}

bool PresenceSession::enter_session(const std::string& participant_id, ParticipantRole role, const std::string& destination) {
    if (participant_id.empty() || destination.empty()) {
        error_relay_->report(ErrorEvent{
            ErrorKind::ValidationError,
            "participant id and destination are required to enter a session",
            "presence_session"
        });
        return false;
    }
    const SessionIdentity identity{participant_id, role, destination};

    std::optional<SessionIdentity> current;
    {
        std::scoped_lock lock(mutex_);
        if (shut_down_) {
            logger_->warn("Enter requested after shutdown for {}", describe(identity));
            return false;
        }
        current = identity_;
    }
    if (current && *current == identity) {
        return true;
    }
    if (current) {
        exit_session();
    }

    {
        std::scoped_lock lock(mutex_);
        identity_ = identity;
        availability_ = SessionAvailability::Available;
        last_error_.reset();
    }
    logger_->info(R"({{"component":"session","event":"enter","identity":"{}"}})", describe(identity));

    publisher_.set_identity(identity);
    discovery_.start_monitoring(identity, acquisition_.current_position());
    acquisition_.request_updates(config_.consumer_id, config_.location_interval, config_.location_priority);
    publish_best_position(identity);
    notify_observer();
    return true;
}

bool PresenceSession::exit_session() {
    std::optional<SessionIdentity> identity;
    {
        std::scoped_lock lock(mutex_);
        identity.swap(identity_);
        availability_ = SessionAvailability::NotAvailable;
    }
    if (!identity) {
        return false;
    }
    logger_->info(R"({{"component":"session","event":"exit","identity":"{}"}})", describe(*identity));

    if (acquisition_.release_updates(config_.consumer_id)) {
        publisher_.cancel_pending();
    }
    discovery_.stop_monitoring();
    const bool confirmed = await_acknowledgement(publisher_.remove(*identity), record_path(*identity));
    if (!confirmed) {
        logger_->warn(
            "Removal of {} not confirmed within {}s; relying on the disconnect hook",
            record_path(*identity),
            config_.teardown_timeout.count()
        );
    }
    notify_observer();
    return confirmed;
}

bool PresenceSession::change_destination(const std::string& destination) {
    if (destination.empty()) {
        error_relay_->report(ErrorEvent{ErrorKind::ValidationError, "destination must not be empty", "presence_session"});
        return false;
    }
    SessionIdentity identity{};
    {
        std::scoped_lock lock(mutex_);
        if (!identity_ || identity_->destination == destination) {
            return false;
        }
        identity_->destination = destination;
        identity = *identity_;
    }
    logger_->info(R"({{"component":"session","event":"change_destination","identity":"{}"}})", describe(identity));
    publisher_.set_identity(identity);
    discovery_.change_destination(destination);
    publish_best_position(identity);
    notify_observer();
    return true;
}

bool PresenceSession::change_role(ParticipantRole role) {
    SessionIdentity identity{};
    {
        std::scoped_lock lock(mutex_);
        if (!identity_ || identity_->role == role) {
            return false;
        }
        identity_->role = role;
        identity = *identity_;
    }
    logger_->info(R"({{"component":"session","event":"change_role","identity":"{}"}})", describe(identity));
    publisher_.set_identity(identity);
    discovery_.change_role(role);
    publish_best_position(identity);
    notify_observer();
    return true;
}

void PresenceSession::set_foreground(bool foreground) {
    acquisition_.set_foreground(foreground);
    publisher_.set_foreground(foreground);
    notify_observer();
}

std::optional<SessionIdentity> PresenceSession::recover_identity(
    const std::string& participant_id,
    const std::vector<std::string>& candidate_destinations
) {
    std::vector<SessionIdentity> list_hits;
    for (const std::string& destination : candidate_destinations) {
        for (const ParticipantRole role : k_all_roles) {
            const SessionIdentity candidate{participant_id, role, destination};
            const std::string path = record_path(candidate);
            try {
                auto pending = store_->read(path);
                if (pending.wait_for(to_steady(config_.teardown_timeout)) != std::future_status::ready) {
                    throw StoreError(StoreError::Cause::Network, fmt::format("read of {} timed out", path));
                }
                if (pending.get()) {
                    list_hits.push_back(candidate);
                }
            } catch (const std::exception& exc) {
                error_relay_->report(ErrorEvent{classify(std::current_exception()), exc.what(), path});
            }
        }
    }

    if (list_hits.size() == 1) {
        logger_->info(R"({{"component":"session","event":"recovered","identity":"{}"}})", describe(list_hits.front()));
        return list_hits.front();
    }
    if (list_hits.size() > 1) {
        std::string str_paths;
        for (const SessionIdentity& hit : list_hits) {
            str_paths += (str_paths.empty() ? "" : ",") + record_path(hit);
        }
        logger_->critical(
            R"({{"component":"session","event":"duplicate_records","participant":"{}","paths":"{}"}})",
            participant_id,
            str_paths
        );
        error_relay_->report(ErrorEvent{
            ErrorKind::InvariantViolation,
            fmt::format("participant {} has {} presence records", participant_id, list_hits.size()),
            str_paths
        });
        for (const SessionIdentity& hit : list_hits) {
            await_acknowledgement(store_->remove(record_path(hit)), record_path(hit));
        }
    }
    return std::nullopt;
}

void PresenceSession::shutdown() {
    std::optional<SessionIdentity> identity;
    {
        std::scoped_lock lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        identity.swap(identity_);
        availability_ = SessionAvailability::NotAvailable;
    }
    logger_->info(R"({{"component":"session","event":"shutdown","in_session":{}}})", identity.has_value());
    acquisition_.release_updates(config_.consumer_id);
    publisher_.cancel_pending();
    discovery_.stop_monitoring();
    if (identity) {
        await_acknowledgement(publisher_.remove(*identity), record_path(*identity));
    }
}

void PresenceSession::set_observer(SessionObserver observer) {
    std::scoped_lock lock(mutex_);
    observer_ = std::move(observer);
}

void PresenceSession::set_notification_sink(NotificationSink sink) {
    std::scoped_lock lock(mutex_);
    notification_sink_ = std::move(sink);
}

SessionSnapshot PresenceSession::snapshot() const {
    SessionSnapshot view{};
    {
        std::scoped_lock lock(mutex_);
        view.availability = availability_;
        view.identity = identity_;
        view.last_error = last_error_;
    }
    view.current_position = acquisition_.current_position();
    view.is_updating = acquisition_.is_updating();
    view.discovered = discovery_.snapshot();
    return view;
}

const LocationAcquisition& PresenceSession::acquisition() const noexcept {
    return acquisition_;
}

const PresencePublisher& PresenceSession::publisher() const noexcept {
    return publisher_;
}

const ProximityDiscovery& PresenceSession::discovery() const noexcept {
    return discovery_;
}

void PresenceSession::on_fix(const LocationFix& fix) {
    std::optional<SessionIdentity> identity;
    {
        std::scoped_lock lock(mutex_);
        identity = identity_;
    }
    if (!identity) {
        return;
    }
    publisher_.publish(*identity, fix.position);
    discovery_.update_location(fix.position);
}

void PresenceSession::on_error(const ErrorEvent& event) {
    {
        std::scoped_lock lock(mutex_);
        if (!identity_ || !is_terminal(event.kind)) {
            return;
        }
        availability_ = SessionAvailability::Error;
        last_error_ = event;
    }
    notify_observer();
}

void PresenceSession::publish_best_position(const SessionIdentity& identity) {
    std::optional<GeodeticCoordinate> position = acquisition_.current_position();
    if (!position) {
        position = acquisition_.last_known();
    }
    if (!position) {
        try {
            auto pending = store_->read(record_path(identity));
            if (pending.wait_for(to_steady(config_.teardown_timeout)) == std::future_status::ready) {
                if (const auto record = pending.get()) {
                    position = record->position();
                    logger_->info("Using stored record of {} as the current position", describe(identity));
                }
            }
        } catch (const std::exception& exc) {
            logger_->warn("Stored record of {} unavailable: {}", describe(identity), exc.what());
        }
    }
    if (!position) {
        logger_->debug("No known position for {}; waiting for the next fix", describe(identity));
        return;
    }
    publisher_.publish(identity, *position);
    discovery_.update_location(*position);
}

void PresenceSession::notify_observer() {
    SessionObserver observer;
    {
        std::scoped_lock lock(mutex_);
        observer = observer_;
    }
    if (!observer) {
        return;
    }
    const SessionSnapshot view = snapshot();
    callback_context_->post([observer, view]() { observer(view); });
}

bool PresenceSession::await_acknowledgement(std::future<void> acknowledgement, const std::string& context) {
    try {
        if (acknowledgement.wait_for(to_steady(config_.teardown_timeout)) != std::future_status::ready) {
            return false;
        }
        acknowledgement.get();
        return true;
    } catch (const std::exception& exc) {
        error_relay_->report(ErrorEvent{classify(std::current_exception()), exc.what(), context});
        return false;
    }
}

}  // namespace transit_presence
