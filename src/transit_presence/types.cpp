#include "transit_presence/types.hpp"

#include <fmt/format.h>

namespace transit_presence {

ParticipantRole opposite_role(ParticipantRole role) noexcept {
    return role == ParticipantRole::Seeker ? ParticipantRole::Provider : ParticipantRole::Seeker;
}

std::string_view role_name(ParticipantRole role) noexcept {
    switch (role) {
        case ParticipantRole::Seeker:
            return "seeker";
        case ParticipantRole::Provider:
            return "provider";
    }
    return "seeker";
}

std::optional<ParticipantRole> parse_role(std::string_view text) noexcept {
    if (text == "seeker" || text == "seekers") {
        return ParticipantRole::Seeker;
    }
    if (text == "provider" || text == "providers") {
        return ParticipantRole::Provider;
    }
    return std::nullopt;
}

std::string partition_path(ParticipantRole role, std::string_view destination) {
    return fmt::format("{}s/{}", role_name(role), destination);
}

std::string record_path(const SessionIdentity& identity) {
    return fmt::format("{}/{}", partition_path(identity.role, identity.destination), identity.participant_id);
}

std::string describe(const SessionIdentity& identity) {
    return fmt::format("{}({}@{})", identity.participant_id, role_name(identity.role), identity.destination);
}

std::string_view priority_name(LocationPriority priority) noexcept {
    switch (priority) {
        case LocationPriority::LowPower:
            return "low_power";
        case LocationPriority::Balanced:
            return "balanced";
        case LocationPriority::HighAccuracy:
            return "high_accuracy";
    }
    return "balanced";
}

}  // namespace transit_presence
