#pragma once
/**
 * @file endpoint_diff.hpp
 * @brief Turns endpoint-membership changes of a local service into pool operations.
 * @details Events arrive at-least-once and unordered relative to routing-table
 *          updates; events for services not (yet) known to be local are dropped.
 */

#include <optional>
#include <string>
#include <vector>

#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/reconcile/operation.hpp"
#include "poolsync/reconcile/operation_sink.hpp"
#include "poolsync/routing/ip_family.hpp"
#include "poolsync/routing/node_ip_resolver.hpp"
#include "poolsync/routing/service_routing_table.hpp"

namespace poolsync::reconcile {

/** @struct MembershipEvent
 *  @brief Nodes carrying endpoints of a service before and after a change.
 */
struct MembershipEvent {
    std::optional<routing::ServiceName> service; ///< Absent when the endpoint set has no owning service
    routing::NodeSet old_nodes;                  ///< Previous node names
    routing::NodeSet new_nodes;                  ///< Current node names
};

/** @struct AddressDiff
 *  @brief Symmetric difference of two resolved address sets.
 */
struct AddressDiff {
    cloud::IpSet added;   ///< new − old
    cloud::IpSet removed; ///< old − new

    bool empty() const noexcept { return added.empty() && removed.empty(); }
};

/// added = next − prev, removed = prev − next.
AddressDiff diff_addresses(const cloud::IpSet& prev, const cloud::IpSet& next);

/**
 * @brief Backend pool name of a local service: lower-cased "namespace-name",
 *        with "-ipv6" appended for IPv6 services.
 */
std::string local_service_pool_name(const routing::ServiceName& service, routing::IpFamily family);

/** @class EndpointDiffEngine
 *  @brief Stateless; safe to call from many watcher threads at once.
 */
class EndpointDiffEngine {
public:
    EndpointDiffEngine(const routing::ServiceRoutingTable& routes,
                       const routing::NodeIpResolver& nodes,
                       OperationSink& sink) noexcept
        : routes_(routes), nodes_(nodes), sink_(sink) {}

    /**
     * @brief Handle one membership change.
     * @return The operations handed to the sink (0, 1 or 2), so the caller can wait on them.
     */
    std::vector<OperationPtr> on_membership_change(const MembershipEvent& event);

private:
    const routing::ServiceRoutingTable& routes_;
    const routing::NodeIpResolver&      nodes_;
    OperationSink&                      sink_;
};

} // namespace poolsync::reconcile
