#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "transit_presence/errors.hpp"

using namespace transit_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    transit_presence::test::ensure_logger_initialized();
    return true;
}();

template <typename Exception>
std::exception_ptr capture(Exception exception) {
    try {
        throw exception;
    } catch (const std::exception&) {
        return std::current_exception();
    }
}
}  // namespace

TEST_CASE("classify maps exceptions onto the error taxonomy") {
    REQUIRE(classify(capture(StoreError(StoreError::Cause::Network, "offline"))) == ErrorKind::NetworkError);
    REQUIRE(classify(capture(StoreError(StoreError::Cause::Authorization, "denied"))) == ErrorKind::AuthorizationError);
    REQUIRE(classify(capture(StoreError(StoreError::Cause::Other, "quota"))) == ErrorKind::StoreError);
    REQUIRE(classify(capture(PresenceError(ErrorKind::LocationError, "gps"))) == ErrorKind::LocationError);
    REQUIRE(classify(capture(std::invalid_argument("bad"))) == ErrorKind::ValidationError);
    REQUIRE(classify(capture(std::runtime_error("boom"))) == ErrorKind::StoreError);
    REQUIRE(describe(capture(std::runtime_error("boom"))) == "boom");
}

TEST_CASE("only network-class failures are retryable") {
    REQUIRE(is_retryable(ErrorKind::NetworkError));
    REQUIRE(is_retryable(ErrorKind::StoreError));
    REQUIRE_FALSE(is_retryable(ErrorKind::AuthorizationError));
    REQUIRE_FALSE(is_retryable(ErrorKind::PermissionDenied));
    REQUIRE_FALSE(is_retryable(ErrorKind::InvariantViolation));
    REQUIRE(StoreError(StoreError::Cause::Authorization, "denied").is_authorization());
}

TEST_CASE("RecordingErrorSink keeps events and forwards them downstream") {
    auto downstream = std::make_shared<RecordingErrorSink>();
    RecordingErrorSink sink{downstream};

    sink.report(ErrorEvent{ErrorKind::NetworkError, "timeout", "seekers/x/a"});
    sink.report(ErrorEvent{ErrorKind::InvariantViolation, "duplicate", "a"});
    sink.report(ErrorEvent{ErrorKind::NetworkError, "timeout", "seekers/x/a"});

    REQUIRE(sink.events().size() == 3);
    REQUIRE(sink.count(ErrorKind::NetworkError) == 2);
    REQUIRE(downstream->count(ErrorKind::InvariantViolation) == 1);

    sink.clear();
    REQUIRE(sink.events().empty());
    REQUIRE(downstream->events().size() == 3);
}

TEST_CASE("LoggingErrorSink accepts every kind") {
    LoggingErrorSink sink{};
    for (const ErrorKind kind : {ErrorKind::PermissionDenied, ErrorKind::InvariantViolation, ErrorKind::SdkInitTimeout}) {
        REQUIRE_NOTHROW(sink.report(ErrorEvent{kind, "message", "context"}));
    }
}
