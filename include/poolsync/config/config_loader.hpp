#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridable from a `key = value` file.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * File format: one `key = value` per line, `#` starts a comment, blank lines
 * are ignored. Recognized keys:
 *   drain_interval_ms      positive integer
 *   skip_unchanged_pools   true | false
 *   validate_routes        true | false
 *   emit_events            true | false
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "poolsync/compat/expected.hpp"
#include "poolsync/reconcile/backend_pool_updater.hpp"

namespace poolsync::config {

    /** @struct SyncConfig
     *  @brief Aggregate of sub-configs required by the reconciler process.
     */
    struct SyncConfig {
        poolsync::reconcile::UpdaterConfig updater;                        ///< Drain loop tunables
        bool emit_events{poolsync::config::constants::EMIT_EVENTS_DEFAULT}; ///< Per-event log lines
    };

    /** @enum ConfigErrc
     *  @brief Why a configuration could not be loaded.
     */
    enum class ConfigErrc : uint8_t {
        FileUnreadable, ///< Path missing or not readable
        MalformedLine,  ///< Line without '=' or with an empty key
        UnknownKey,     ///< Key not recognized
        InvalidValue    ///< Value out of range or of the wrong type
    };

    /** @struct ConfigError
     *  @brief Error with location for operator-facing messages.
     */
    struct ConfigError {
        ConfigErrc  code{ConfigErrc::MalformedLine};
        std::size_t line{0};   ///< 1-based; 0 when not line-specific
        std::string detail;

        std::string to_string() const;
    };

    /** @class Loader
     *  @brief Source of reconciler configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Named defaults from constants.hpp.
        static SyncConfig defaults();

        /**
         * @brief Parse configuration text on top of the defaults.
         * @param text File contents.
         * @return SyncConfig, or the first error encountered.
         */
        static poolsync_detail::expected<SyncConfig, ConfigError> parse(std::string_view text);

        /**
         * @brief Load configuration from a path.
         * @param path File to read.
         */
        static poolsync_detail::expected<SyncConfig, ConfigError> load_from_file(const std::string& path);
    };

} // namespace poolsync::config
