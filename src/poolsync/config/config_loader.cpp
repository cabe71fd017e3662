/**
* @file config_loader.cpp
 * @brief `key = value` parser layered over the named defaults.
 */
#include "poolsync/config/config_loader.hpp"
#include "poolsync/config/constants.hpp"

#include <charconv>
#include <chrono>
#include <fstream>
#include <sstream>

namespace poolsync::config {
    using namespace poolsync::config::constants;

    static std::string_view trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    static bool parse_bool(std::string_view v, bool& out) {
        if (v == "true" || v == "1" || v == "yes")  { out = true;  return true; }
        if (v == "false" || v == "0" || v == "no")  { out = false; return true; }
        return false;
    }

    static bool parse_positive(std::string_view v, uint32_t& out) {
        uint32_t n = 0;
        const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
        if (ec != std::errc{} || ptr != v.data() + v.size() || n == 0) return false;
        out = n;
        return true;
    }

    std::string ConfigError::to_string() const {
        const char* what = "malformed line";
        switch (code) {
            case ConfigErrc::FileUnreadable: what = "file unreadable"; break;
            case ConfigErrc::MalformedLine:  what = "malformed line"; break;
            case ConfigErrc::UnknownKey:     what = "unknown key"; break;
            case ConfigErrc::InvalidValue:   what = "invalid value"; break;
        }
        std::string out = what;
        if (line > 0) out += " at line " + std::to_string(line);
        if (!detail.empty()) out += ": " + detail;
        return out;
    }

    SyncConfig Loader::defaults() {
        SyncConfig sc;
        sc.updater = poolsync::reconcile::UpdaterConfig{}; // picks defaults from constants
        sc.emit_events = EMIT_EVENTS_DEFAULT;
        return sc;
    }

    poolsync_detail::expected<SyncConfig, ConfigError> Loader::parse(std::string_view text) {
        SyncConfig sc = defaults();
        std::size_t lineno = 0;

        while (!text.empty()) {
            ++lineno;
            const auto nl = text.find('\n');
            std::string_view raw = text.substr(0, nl);
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

            if (const auto hash = raw.find('#'); hash != std::string_view::npos) raw = raw.substr(0, hash);
            const auto line = trim(raw);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string_view::npos) {
                return poolsync_detail::unexpected(ConfigError{ConfigErrc::MalformedLine, lineno, std::string(line)});
            }
            const auto key = trim(line.substr(0, eq));
            const auto val = trim(line.substr(eq + 1));
            if (key.empty()) {
                return poolsync_detail::unexpected(ConfigError{ConfigErrc::MalformedLine, lineno, std::string(line)});
            }

            bool ok = false;
            if (key == "drain_interval_ms") {
                uint32_t ms = 0;
                ok = parse_positive(val, ms);
                if (ok) sc.updater.drain_interval = std::chrono::milliseconds(ms);
            } else if (key == "skip_unchanged_pools") {
                ok = parse_bool(val, sc.updater.skip_unchanged_pools);
            } else if (key == "validate_routes") {
                ok = parse_bool(val, sc.updater.validate_routes);
            } else if (key == "emit_events") {
                ok = parse_bool(val, sc.emit_events);
            } else {
                return poolsync_detail::unexpected(ConfigError{ConfigErrc::UnknownKey, lineno, std::string(key)});
            }
            if (!ok) {
                return poolsync_detail::unexpected(
                    ConfigError{ConfigErrc::InvalidValue, lineno, std::string(key) + " = " + std::string(val)});
            }
        }
        return sc;
    }

    poolsync_detail::expected<SyncConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return poolsync_detail::unexpected(ConfigError{ConfigErrc::FileUnreadable, 0, path});
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse(ss.str());
    }

} // namespace poolsync::config
