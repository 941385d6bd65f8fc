#include "transit_presence/errors.hpp"

#include <algorithm>

namespace transit_presence {

std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::PermissionDenied:
            return "permission_denied";
        case ErrorKind::NetworkError:
            return "network_error";
        case ErrorKind::StoreError:
            return "store_error";
        case ErrorKind::AuthorizationError:
            return "authorization_error";
        case ErrorKind::SdkInitTimeout:
            return "sdk_init_timeout";
        case ErrorKind::InvariantViolation:
            return "invariant_violation";
        case ErrorKind::LocationError:
            return "location_error";
        case ErrorKind::ValidationError:
            return "validation_error";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::NetworkError || kind == ErrorKind::StoreError;
}

PresenceError::PresenceError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

ErrorKind PresenceError::kind() const noexcept {
    return kind_;
}

namespace {

ErrorKind kind_for_cause(StoreError::Cause cause) noexcept {
    switch (cause) {
        case StoreError::Cause::Network:
            return ErrorKind::NetworkError;
        case StoreError::Cause::Authorization:
            return ErrorKind::AuthorizationError;
        case StoreError::Cause::Other:
            return ErrorKind::StoreError;
    }
    return ErrorKind::StoreError;
}

}  // namespace

StoreError::StoreError(Cause cause, const std::string& message)
    : PresenceError(kind_for_cause(cause), message),
      cause_(cause) {}

StoreError::Cause StoreError::cause() const noexcept {
    return cause_;
}

bool StoreError::is_authorization() const noexcept {
    return cause_ == Cause::Authorization;
}

ErrorKind classify(std::exception_ptr error) noexcept {
    if (!error) {
        return ErrorKind::StoreError;
    }
    try {
        std::rethrow_exception(error);
    } catch (const PresenceError& presence_error) {
        return presence_error.kind();
    } catch (const std::invalid_argument&) {
        return ErrorKind::ValidationError;
    } catch (const std::exception&) {
        return ErrorKind::StoreError;
    } catch (...) {
        return ErrorKind::StoreError;
    }
}

std::string describe(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& exc) {
        return exc.what();
    } catch (...) {
        return "unknown exception";
    }
}

LoggingErrorSink::LoggingErrorSink()
    : logger_(get_logger()) {}

void LoggingErrorSink::report(const ErrorEvent& event) {
    spdlog::level::level_enum level = spdlog::level::err;
    switch (event.kind) {
        case ErrorKind::InvariantViolation:
            level = spdlog::level::critical;
            break;
        case ErrorKind::NetworkError:
        case ErrorKind::SdkInitTimeout:
        case ErrorKind::ValidationError:
            level = spdlog::level::warn;
            break;
        default:
            break;
    }
    logger_->log(
        level,
        R"({{"component":"error_sink","kind":"{}","context":"{}","message":"{}"}})",
        error_kind_name(event.kind),
        event.context,
        event.message
    );
}

RecordingErrorSink::RecordingErrorSink(ErrorSinkPtr downstream)
    : downstream_(std::move(downstream)) {}

void RecordingErrorSink::report(const ErrorEvent& event) {
    {
        std::scoped_lock lock(mutex_);
        list_events_.push_back(event);
    }
    if (downstream_ != nullptr) {
        downstream_->report(event);
    }
}

std::vector<ErrorEvent> RecordingErrorSink::events() const {
    std::scoped_lock lock(mutex_);
    return list_events_;
}

std::size_t RecordingErrorSink::count(ErrorKind kind) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        list_events_.begin(),
        list_events_.end(),
        [kind](const ErrorEvent& event) { return event.kind == kind; }
    ));
}

void RecordingErrorSink::clear() {
    std::scoped_lock lock(mutex_);
    list_events_.clear();
}

}  // namespace transit_presence
