// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects for acquisition, publishing,
// discovery, bootstrap and session settings. `ConfigurationLoader` translates
// `TRANSIT_PRESENCE_*` environment variables into these structures so
// downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "transit_presence/location_acquisition.hpp"
#include "transit_presence/presence_publisher.hpp"
#include "transit_presence/presence_session.hpp"
#include "transit_presence/proximity_discovery.hpp"
#include "transit_presence/sdk_readiness_guard.hpp"
#include "transit_presence/startup_sequencer.hpp"

namespace transit_presence {

/**
 * @brief Settings of the start-up path: SDK readiness and stage budgets.
 */
struct BootstrapConfig final {
    SdkReadinessConfig sdk{};     /**< Mapping SDK probing and attempt budget. */
    StartupConfig startup{};      /**< Critical and best-effort phase budgets. */
};

/**
 * @brief Immutable bundle of runtime knobs for the presence subsystem.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};       /**< Destination directory for structured logs. */
    AcquisitionConfig acquisition{};   /**< Adaptive sampling table and power cache. */
    PublisherConfig publisher{};       /**< Debounce, settle and retry settings. */
    DiscoveryConfig discovery{};       /**< Alert radius and notification toggles. */
    BootstrapConfig bootstrap{};       /**< Start-up budgets. */
    SessionConfig session{};           /**< Session consumer and teardown settings. */

    /** @brief Component settings handed to a PresenceSession. */
    [[nodiscard]] PresenceSessionSettings session_settings() const;
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Initialize the logger and read every setting.
     *
     * Non-positive or unparsable values fall back to their default with a
     * warning. The result is validated before it is returned.
     */
    static Configuration load(const std::filesystem::path& config_root);
};

}  // namespace transit_presence
