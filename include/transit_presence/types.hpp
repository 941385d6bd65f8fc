// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the presence subsystem (time primitives, coordinates, participant identity,
// location priorities, etc.).

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace transit_presence {

/**
 * @brief Alias for the steady clock used for all scheduling decisions.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Convert a floating-point duration into the steady clock's native tick.
 */
inline SteadyClock::duration to_steady(Duration duration) {
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    bool operator==(const GeodeticCoordinate&) const = default;
};

/**
 * @brief The two participant roles sharing the directory.
 */
enum class ParticipantRole {
    Seeker,   /**< Participant looking for a ride. */
    Provider  /**< Participant offering a ride. */
};

/**
 * @brief Return the counterpart role watched by discovery.
 */
ParticipantRole opposite_role(ParticipantRole role) noexcept;

/**
 * @brief Singular lower-case role name ("seeker" / "provider").
 */
std::string_view role_name(ParticipantRole role) noexcept;

/**
 * @brief Parse a role name; accepts singular and plural forms.
 */
std::optional<ParticipantRole> parse_role(std::string_view text) noexcept;

/**
 * @brief Identity triple that addresses one presence record.
 */
struct SessionIdentity final {
    std::string participant_id{};                 /**< Stable, externally assigned id. */
    ParticipantRole role{ParticipantRole::Seeker};/**< Role chosen for this session. */
    std::string destination{};                    /**< Destination partition name. */

    bool operator==(const SessionIdentity&) const = default;
};

/**
 * @brief Directory path of a partition: `{role}s/{destination}`.
 */
std::string partition_path(ParticipantRole role, std::string_view destination);

/**
 * @brief Directory path of a record: `{role}s/{destination}/{participant_id}`.
 */
std::string record_path(const SessionIdentity& identity);

/**
 * @brief Human-readable identity for log lines.
 */
std::string describe(const SessionIdentity& identity);

/**
 * @brief Accuracy/power trade-off requested from the platform provider.
 *
 * Ordered from least to most demanding so `std::max` picks the stronger one.
 */
enum class LocationPriority {
    LowPower,      /**< Coarse fixes, minimal battery use. */
    Balanced,      /**< Block-level accuracy. */
    HighAccuracy   /**< Best available accuracy. */
};

std::string_view priority_name(LocationPriority priority) noexcept;

/**
 * @brief One position fix delivered by the platform provider.
 */
struct LocationFix final {
    GeodeticCoordinate position{};             /**< Reported position. */
    double accuracy_m{};                       /**< Horizontal accuracy radius in metres. */
    TimePoint captured_at{SteadyClock::now()}; /**< Capture time. */
};

/**
 * @brief Value stored in the directory for one available participant.
 */
struct PresenceRecord final {
    double latitude{};                            /**< Latitude in decimal degrees. */
    double longitude{};                           /**< Longitude in decimal degrees. */
    std::int64_t server_timestamp_ms{};           /**< Assigned by the store on write. */
    ParticipantRole role{ParticipantRole::Seeker};/**< Role of the owner. */
    std::string destination{};                    /**< Partition of the owner. */

    [[nodiscard]] GeodeticCoordinate position() const noexcept {
        return GeodeticCoordinate{latitude, longitude};
    }
};

}  // namespace transit_presence
