#pragma once
// poolsync: ServiceRoutingTable
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: every membership event and every drained operation
//     performs a lookup; writes only happen when a service is (re)configured.
//   • Writers copy the whole map, mutate, and atomically swap with RELEASE semantics.
//     Writers are serialized by a mutex so concurrent upserts never lose an update.
//   • Readers never block; grace period is handled by shared_ptr refcounts.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "poolsync/routing/ip_family.hpp"
#include "poolsync/routing/registry_common.hpp"
#include "poolsync/routing/service_name.hpp"

namespace poolsync::routing {

/**
 * @brief Routing record of a locally routed service.
 */
struct ServiceRoute final {
    std::string load_balancer;          ///< Load balancer the service is assigned to
    IpFamily    family{IpFamily::IPv4}; ///< Family of the backend pool

    bool operator==(const ServiceRoute&) const = default;
};

///
/// Maintains: lower-cased "namespace/name" → ServiceRoute, for local services only.
/// A service absent from the table is not locally routed.
///
/// Thread-safety:
///   - Reads are lock-free and see a consistent (possibly slightly stale) snapshot.
///   - Writes are serialized per call, may allocate.
///
class ServiceRoutingTable final {
public:
    using Map = std::unordered_map<std::string, ServiceRoute, SKeyHash, SKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the whole table.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Route of a service by key ("ns/name", any case).
    [[nodiscard]] std::optional<ServiceRoute> lookup(std::string_view service_key) const;
    [[nodiscard]] std::optional<ServiceRoute> lookup(const ServiceName& service) const;

    [[nodiscard]] bool is_local(std::string_view service_key) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> list_services() const;

    /// Monotonic version counter. Increments on every published mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Mark a service as locally routed (or update its LB / family).
    RegistryErr upsert(const ServiceName& service, ServiceRoute route);

    /// Service stopped being locally routed. Returns true if it was present.
    bool remove(std::string_view service_key);

    /// Drop every entry. Treated as maintenance operation.
    void clear();

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t upserts{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    void publish(std::shared_ptr<Map> next) noexcept;

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_;

    std::atomic<uint64_t> upserts_{0}, removes_{0}, failures_{0};
};

} // namespace poolsync::routing
