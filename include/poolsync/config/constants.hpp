#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the backend-pool reconciler.
 * @details These values eliminate magic numbers from the codebase. Override the
 *          tunable ones via the Config Loader in production deployments.
 */

#include <cstdint>
#include <string_view>

namespace poolsync::config::constants {

// =====================
// Batching loop
// =====================
/// Interval between two drain ticks of the pending queue.
inline constexpr uint32_t DRAIN_INTERVAL_MS_DEFAULT = 30000; ///< 30 s
/// Skip the remote update when the merge left the pool unchanged.
inline constexpr bool     SKIP_UNCHANGED_POOLS_DEFAULT = true;
/// Re-check every drained operation against the service routing table.
inline constexpr bool     VALIDATE_ROUTES_DEFAULT = true;
/// Emit one observability line per reconciliation event.
inline constexpr bool     EMIT_EVENTS_DEFAULT = true;

// =====================
// Retry policy
// =====================
/// Retry cycles (re-fetch + re-merge + re-apply) granted to one pool group per tick.
inline constexpr uint32_t GROUP_RETRY_BUDGET = 1;

// =====================
// Cloud API status codes (HTTP semantics)
// =====================
inline constexpr int HTTP_STATUS_OK        = 200;
inline constexpr int HTTP_STATUS_NOT_FOUND = 404;

// =====================
// Naming
// =====================
/// Separator between load-balancer and pool name in a pool key ("lb/pool").
inline constexpr char POOL_KEY_SEPARATOR = '/';
/// Suffix appended to the pool name of IPv6 local services.
inline constexpr std::string_view IPV6_POOL_SUFFIX = "ipv6";

} // namespace poolsync::config::constants
