// === Errors ==================================================================
//
// Error taxonomy shared by every component, the exception types thrown at
// failure sites, and the `ErrorSink` seam through which terminal or exhausted
// failures are reported to telemetry without coupling to any UI.

#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "transit_presence/logging.hpp"

namespace transit_presence {

/**
 * @brief Classification of every failure the subsystem can report.
 */
enum class ErrorKind {
    PermissionDenied,    /**< Location permission absent. Terminal, user-actionable. */
    NetworkError,        /**< Transient connectivity failure. Retried while foregrounded. */
    StoreError,          /**< Store-side failure that is neither network nor authorization. */
    AuthorizationError,  /**< Store rejected the caller. Terminal. */
    SdkInitTimeout,      /**< Mapping SDK did not become ready in time. */
    InvariantViolation,  /**< Internal consistency broken; forces a state reset. */
    LocationError,       /**< Platform provider failure. */
    ValidationError      /**< Request rejected before reaching a collaborator. */
};

std::string_view error_kind_name(ErrorKind kind) noexcept;

/**
 * @brief Whether a failure of this kind may be retried locally.
 */
bool is_retryable(ErrorKind kind) noexcept;

/**
 * @brief Structured error event delivered to the telemetry sink.
 */
struct ErrorEvent final {
    ErrorKind kind{ErrorKind::StoreError}; /**< Failure classification. */
    std::string message{};                 /**< Human-readable description. */
    std::string context{};                 /**< Component or path the failure relates to. */
};

/**
 * @brief Base exception carrying an ErrorKind.
 */
class PresenceError : public std::runtime_error {
  public:
    PresenceError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept;

  private:
    ErrorKind kind_;
};

/**
 * @brief Failure reported by a PresenceStore operation.
 */
class StoreError final : public PresenceError {
  public:
    enum class Cause {
        Network,        /**< Connection lost, timed out, or unreachable. */
        Authorization,  /**< Rules or credentials rejected the operation. */
        Other           /**< Anything else the backend reported. */
    };

    StoreError(Cause cause, const std::string& message);

    [[nodiscard]] Cause cause() const noexcept;
    [[nodiscard]] bool is_authorization() const noexcept;

  private:
    Cause cause_;
};

/**
 * @brief Map a caught exception onto the taxonomy.
 */
ErrorKind classify(std::exception_ptr error) noexcept;

/**
 * @brief Extract a printable message from a caught exception.
 */
std::string describe(std::exception_ptr error);

/**
 * @brief Receives structured error events. Implementations must be thread-safe.
 */
class ErrorSink {
  public:
    virtual ~ErrorSink() = default;

    virtual void report(const ErrorEvent& event) = 0;
};

using ErrorSinkPtr = std::shared_ptr<ErrorSink>;

/**
 * @brief Writes each event to the shared logger at a severity derived from its kind.
 */
class LoggingErrorSink final : public ErrorSink {
  public:
    LoggingErrorSink();

    void report(const ErrorEvent& event) override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Keeps every event in memory and forwards it to an optional downstream sink.
 */
class RecordingErrorSink final : public ErrorSink {
  public:
    explicit RecordingErrorSink(ErrorSinkPtr downstream = nullptr);

    void report(const ErrorEvent& event) override;

    [[nodiscard]] std::vector<ErrorEvent> events() const;
    [[nodiscard]] std::size_t count(ErrorKind kind) const;
    void clear();

  private:
    ErrorSinkPtr downstream_;
    mutable std::mutex mutex_;
    std::vector<ErrorEvent> list_events_;
};

}  // namespace transit_presence
