#pragma once
/**
 * @file backend_pool_updater.hpp
 * @brief Batched backend-pool reconciler: pending queue + periodic drain loop.
 *
 * Producers enqueue operations at any time. Every drain interval the loop
 * swaps the pending queue out, optionally re-validates each operation against
 * the service routing table, groups the survivors by (load balancer, pool) and
 * runs one asynchronous task per group. A tick waits for all of its group tasks,
 * so at most one fetch/merge/apply sequence per pool is ever in flight.
 *
 * Operations enqueued while a tick runs are picked up by the next tick.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "poolsync/cloud/pool_client.hpp"
#include "poolsync/config/constants.hpp"
#include "poolsync/obs/observability.hpp"
#include "poolsync/reconcile/operation_sink.hpp"
#include "poolsync/reconcile/pending_queue.hpp"
#include "poolsync/reconcile/pool_reconciler.hpp"
#include "poolsync/routing/service_routing_table.hpp"

namespace poolsync::reconcile {

/** @struct UpdaterConfig
 *  @brief Tunables of the drain loop.
 */
struct UpdaterConfig {
    std::chrono::milliseconds drain_interval{poolsync::config::constants::DRAIN_INTERVAL_MS_DEFAULT}; ///< Tick period
    bool skip_unchanged_pools{poolsync::config::constants::SKIP_UNCHANGED_POOLS_DEFAULT}; ///< No-op merge skips the update
    bool validate_routes{poolsync::config::constants::VALIDATE_ROUTES_DEFAULT};           ///< Drop operations whose route changed
};

/** @struct TickReport
 *  @brief Summary of one drain tick.
 */
struct TickReport {
    std::size_t drained{0};           ///< Operations swapped out of the queue
    std::size_t stale_dropped{0};     ///< Operations resolved as StaleRoute
    std::vector<GroupReport> groups;  ///< One entry per dispatched (lb, pool)
};

class BackendPoolUpdater final : public OperationSink {
public:
    /**
     * @param client   Remote pool API, shared by the concurrent group tasks.
     * @param routes   Routing table used for drain-time validation; nullptr disables it.
     * @param cfg      Loop configuration.
     * @param observer Event sink; defaults to the process-wide simple observer.
     */
    BackendPoolUpdater(cloud::PoolClient& client,
                       const routing::ServiceRoutingTable* routes,
                       UpdaterConfig cfg = {},
                       obs::Observer* observer = obs::make_simple_observer());
    ~BackendPoolUpdater() override;

    BackendPoolUpdater(const BackendPoolUpdater&) = delete;
    BackendPoolUpdater& operator=(const BackendPoolUpdater&) = delete;

    /// Queue an operation for the next tick. After stop() the operation is
    /// resolved immediately with a Shutdown error.
    void enqueue(OperationPtr op) override;

    /// Withdraw every still-pending operation of a service ("ns/name", any case).
    /// Operations already taken by a tick are unaffected. Returns the count removed.
    std::size_t withdraw(std::string_view service_key);

    /// Start the drain loop thread. No-op if already running.
    void start();

    /**
     * @brief Stop the loop, let the in-flight tick finish, and resolve every
     *        operation still pending with a Shutdown error. Idempotent.
     */
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Run one drain tick synchronously on the calling thread.
    TickReport process_once();

    [[nodiscard]] std::size_t pending() const { return queue_.size(); }
    [[nodiscard]] const UpdaterConfig& config() const noexcept { return cfg_; }

private:
    void run_loop();
    void emit(obs::EventKind kind, std::string service, std::size_t count, std::string reason);

    /// Split drained operations into dispatchable ones and stale ones (resolved here).
    std::vector<OperationPtr> validate(std::vector<OperationPtr> drained, std::size_t& stale);

    /// Run one group, converting a thrown collaborator error into a group failure.
    GroupReport run_group(const PoolGroup& group) const;
    GroupReport fail_internal(const PoolGroup& group, std::string message) const;

    cloud::PoolClient&                  client_;
    const routing::ServiceRoutingTable* routes_;
    UpdaterConfig                       cfg_;
    obs::Observer*                      observer_;
    PoolReconciler                      reconciler_;
    PendingQueue                        queue_;

    std::mutex              lifecycle_mu_;   ///< Serializes start()/stop()
    std::mutex              tick_mu_;        ///< One tick at a time (loop vs manual calls)
    std::mutex              cv_mu_;
    std::condition_variable cv_;
    bool                    stop_requested_{false}; ///< Guarded by cv_mu_
    std::atomic<bool>       running_{false};
    std::thread             thread_;
};

} // namespace poolsync::reconcile
