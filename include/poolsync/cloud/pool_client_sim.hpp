#pragma once
/**
 * @file pool_client_sim.hpp
 * @brief In-memory cloud backend-pool API with scripted failures.
 * @details Stands in for the network API in tests and in the simulator app.
 *          Thread-safe: group tasks of one drain tick call it concurrently.
 */

#include "poolsync/cloud/pool_client.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace poolsync::cloud {

    /**
     * @class PoolClientSim
     * @brief PoolClient backed by a map of "lb/pool" -> BackendPool.
     *
     * Scripted errors are consumed in FIFO order, one per call, before the
     * simulated state is consulted. A missing pool yields a 404 on get; an
     * update creates the pool if needed (CreateOrUpdate semantics). Load balancer
     * and pool names are matched case-insensitively, as the cloud API does.
     */
    class PoolClientSim final : public PoolClient {
    public:
        /// Insert or replace a pool (keyed by its load_balancer and name).
        void put_pool(BackendPool pool);

        /// Drop a pool so subsequent gets return 404.
        void erase_pool(const std::string& load_balancer, const std::string& pool);

        /// Current simulated state of a pool.
        [[nodiscard]] std::optional<BackendPool> pool(const std::string& load_balancer,
                                                      const std::string& pool) const;

        /// Fail the next get of this pool with `err`.
        void fail_next_get(const std::string& load_balancer, const std::string& pool, CloudError err);

        /// Fail the next update of this pool with `err`.
        void fail_next_update(const std::string& load_balancer, const std::string& pool, CloudError err);

        /// Delay applied to every call (models network latency).
        void set_latency(std::chrono::milliseconds latency) noexcept;

        [[nodiscard]] std::size_t get_calls(const std::string& load_balancer, const std::string& pool) const;
        [[nodiscard]] std::size_t update_calls(const std::string& load_balancer, const std::string& pool) const;
        [[nodiscard]] std::size_t total_get_calls() const;
        [[nodiscard]] std::size_t total_update_calls() const;

        /// Every definition passed to create_or_update for this pool, in call order.
        [[nodiscard]] std::vector<BackendPool> update_history(const std::string& load_balancer,
                                                              const std::string& pool) const;

        poolsync_detail::expected<BackendPool, CloudError>
        get_backend_pool(const std::string& load_balancer, const std::string& pool) override;

        poolsync_detail::expected<void, CloudError>
        create_or_update_backend_pool(const std::string& load_balancer, const std::string& pool,
                                      const BackendPool& desired) override;

    private:
        struct Entry {
            std::optional<BackendPool> pool;
            std::deque<CloudError>     get_failures;
            std::deque<CloudError>     update_failures;
            std::size_t                gets{0};
            std::size_t                updates{0};
            std::vector<BackendPool>   history;
        };

        void simulate_latency() const;

        mutable std::mutex mu_;
        std::unordered_map<std::string, Entry> entries_;
        std::chrono::milliseconds latency_{0};
    };

} // namespace poolsync::cloud
