#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: reconciliation events + counters.
 * @details Replace the backing implementation with a structured logger later.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace poolsync::obs {

    /** @enum EventKind
     *  @brief What happened to a pending operation or a pool group.
     */
    enum class EventKind : uint8_t {
        Enqueued,        ///< Operation accepted into the pending queue
        Withdrawn,       ///< Pending operations removed by service name
        Tick,            ///< Drain tick finished (count = operations drained)
        StaleDropped,    ///< Drained operation no longer matches the routing table
        PoolUpdated,     ///< Remote update succeeded
        PoolUnchanged,   ///< Merge was a no-op; update skipped
        PoolNotFound,    ///< Fetch returned 404; group resolved as success
        Retry,           ///< Retriable failure, group re-fetches once
        PoolFailed,      ///< Terminal failure surfaced to the group
        Shutdown         ///< Operations resolved because the updater stopped
    };

    /// Stable lowercase label for an event kind.
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for the reconciler.
     */
    struct Counters {
        uint64_t enqueued{0};        ///< Operations accepted
        uint64_t withdrawn{0};       ///< Operations withdrawn before a drain
        uint64_t ticks{0};           ///< Drain ticks completed
        uint64_t drained{0};         ///< Operations picked up by ticks
        uint64_t stale_dropped{0};   ///< Operations dropped by route validation
        uint64_t pool_updates{0};    ///< Successful remote updates
        uint64_t pool_unchanged{0};  ///< Groups whose merge was a no-op
        uint64_t pool_not_found{0};  ///< Groups short-circuited by a 404
        uint64_t retries{0};         ///< Retry cycles started
        uint64_t failures{0};        ///< Groups resolved with a terminal error
        uint64_t shutdown_resolved{0}; ///< Operations resolved at shutdown
    };

    /** @struct ReconcileEvent
     *  @brief Payload describing a single reconciliation event.
     */
    struct ReconcileEvent {
        EventKind   kind{EventKind::Tick}; ///< Event class
        std::string pool_key;              ///< "lb/pool" (empty for queue-level events)
        std::string service;               ///< Originating service key, when relevant
        std::size_t count{0};              ///< Operations affected
        std::string reason;                ///< Reason label / error text (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single reconciliation event.
        virtual void record(const ReconcileEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide printf-backed observer.
    Observer* make_simple_observer();

    /// Enable/disable the per-event line of the simple observer (counters always update).
    void set_simple_observer_output(bool enabled);

    /// Add one event to a Counters aggregate (shared by Observer implementations).
    void accumulate(Counters& c, const ReconcileEvent& e) noexcept;

} // namespace poolsync::obs
