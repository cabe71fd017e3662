#pragma once
// poolsync: NodeIpResolver
// Lower-cased node name → set of private IP addresses, updated by node
// lifecycle events and read by the endpoint diff engine on every membership
// change. Same RCU snapshot-swap model as ServiceRoutingTable.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/routing/ip_family.hpp"
#include "poolsync/routing/registry_common.hpp"

namespace poolsync::routing {

/// Set of node names (as carried by endpoint membership events).
using NodeSet = std::set<std::string, std::less<>>;

class NodeIpResolver final {
public:
    using Map = std::unordered_map<std::string, cloud::IpSet, SKeyHash, SKeyEq>;

    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Known IPs of one node (empty if unknown).
    [[nodiscard]] cloud::IpSet ips_of(std::string_view node) const;

    /**
     * @brief Union of the IPs of `nodes`, optionally restricted to one family.
     * Nodes without a known address contribute nothing.
     */
    [[nodiscard]] cloud::IpSet resolve(const NodeSet& nodes,
                                       std::optional<IpFamily> family = std::nullopt) const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    /// Replace the IP set of a node. An empty set forgets the node.
    RegistryErr set_node_ips(std::string_view node, const cloud::IpSet& ips);

    /// Add one IP to a node (creating the node entry if needed).
    RegistryErr add_node_ip(std::string_view node, std::string_view ip);

    /// Remove one IP from a node; the node is forgotten when its set becomes empty.
    RegistryErr remove_node_ip(std::string_view node, std::string_view ip);

    /// Forget a node entirely. Returns true if it was known.
    bool remove_node(std::string_view node);

private:
    static bool validate_ips(const cloud::IpSet& ips) noexcept;
    void publish(std::shared_ptr<Map> next) noexcept;

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_;
};

} // namespace poolsync::routing
