/**
* @file pool_client_sim.cpp
 * @brief Implementation of the in-memory backend-pool API.
 */
#include "poolsync/cloud/pool_client_sim.hpp"
#include "poolsync/routing/service_name.hpp"

#include <thread>
#include <utility>

namespace poolsync::cloud {

    // Cloud resource names compare case-insensitively.
    static std::string entry_key(std::string_view lb, std::string_view name) {
        return routing::to_lower(pool_key(lb, name));
    }

    void PoolClientSim::put_pool(BackendPool p) {
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[entry_key(p.load_balancer, p.name)];
        e.pool = std::move(p);
    }

    void PoolClientSim::erase_pool(const std::string& lb, const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(entry_key(lb, name));
        if (it != entries_.end()) it->second.pool.reset();
    }

    std::optional<BackendPool> PoolClientSim::pool(const std::string& lb, const std::string& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(entry_key(lb, name));
        if (it == entries_.end()) return std::nullopt;
        return it->second.pool;
    }

    void PoolClientSim::fail_next_get(const std::string& lb, const std::string& name, CloudError err) {
        std::lock_guard<std::mutex> lk(mu_);
        entries_[entry_key(lb, name)].get_failures.push_back(std::move(err));
    }

    void PoolClientSim::fail_next_update(const std::string& lb, const std::string& name, CloudError err) {
        std::lock_guard<std::mutex> lk(mu_);
        entries_[entry_key(lb, name)].update_failures.push_back(std::move(err));
    }

    void PoolClientSim::set_latency(std::chrono::milliseconds latency) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        latency_ = latency;
    }

    std::size_t PoolClientSim::get_calls(const std::string& lb, const std::string& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(entry_key(lb, name));
        return it == entries_.end() ? 0 : it->second.gets;
    }

    std::size_t PoolClientSim::update_calls(const std::string& lb, const std::string& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(entry_key(lb, name));
        return it == entries_.end() ? 0 : it->second.updates;
    }

    std::size_t PoolClientSim::total_get_calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t n = 0;
        for (const auto& kv : entries_) n += kv.second.gets;
        return n;
    }

    std::size_t PoolClientSim::total_update_calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t n = 0;
        for (const auto& kv : entries_) n += kv.second.updates;
        return n;
    }

    std::vector<BackendPool> PoolClientSim::update_history(const std::string& lb, const std::string& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(entry_key(lb, name));
        if (it == entries_.end()) return {};
        return it->second.history;
    }

    void PoolClientSim::simulate_latency() const {
        std::chrono::milliseconds d{0};
        {
            std::lock_guard<std::mutex> lk(mu_);
            d = latency_;
        }
        if (d.count() > 0) std::this_thread::sleep_for(d);
    }

    poolsync_detail::expected<BackendPool, CloudError>
    PoolClientSim::get_backend_pool(const std::string& lb, const std::string& name) {
        simulate_latency();
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[entry_key(lb, name)];
        e.gets++;
        if (!e.get_failures.empty()) {
            CloudError err = std::move(e.get_failures.front());
            e.get_failures.pop_front();
            return poolsync_detail::unexpected(std::move(err));
        }
        if (!e.pool) {
            return poolsync_detail::unexpected(
                CloudError::not_found("backend pool " + pool_key(lb, name) + " not found"));
        }
        return *e.pool; // copy: caller mutates its own snapshot
    }

    poolsync_detail::expected<void, CloudError>
    PoolClientSim::create_or_update_backend_pool(const std::string& lb, const std::string& name,
                                                 const BackendPool& desired) {
        simulate_latency();
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[entry_key(lb, name)];
        e.updates++;
        e.history.push_back(desired);
        if (!e.update_failures.empty()) {
            CloudError err = std::move(e.update_failures.front());
            e.update_failures.pop_front();
            return poolsync_detail::unexpected(std::move(err));
        }
        BackendPool stored = desired;
        stored.name = name;
        stored.load_balancer = lb;
        e.pool = std::move(stored);
        return {};
    }

} // namespace poolsync::cloud
