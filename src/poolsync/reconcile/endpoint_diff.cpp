/**
* @file endpoint_diff.cpp
 * @brief Membership diff → AddIPs / RemoveIPs operations.
 */
#include "poolsync/reconcile/endpoint_diff.hpp"
#include "poolsync/config/constants.hpp"

#include <algorithm>
#include <iterator>

namespace poolsync::reconcile {

AddressDiff diff_addresses(const cloud::IpSet& prev, const cloud::IpSet& next) {
    AddressDiff d;
    std::set_difference(next.begin(), next.end(), prev.begin(), prev.end(),
                        std::inserter(d.added, d.added.end()));
    std::set_difference(prev.begin(), prev.end(), next.begin(), next.end(),
                        std::inserter(d.removed, d.removed.end()));
    return d;
}

std::string local_service_pool_name(const routing::ServiceName& service, routing::IpFamily family) {
    std::string name = routing::to_lower(service.ns);
    name += '-';
    name += routing::to_lower(service.name);
    if (family == routing::IpFamily::IPv6) {
        name += '-';
        name += config::constants::IPV6_POOL_SUFFIX;
    }
    return name;
}

std::vector<OperationPtr> EndpointDiffEngine::on_membership_change(const MembershipEvent& event) {
    std::vector<OperationPtr> out;
    if (!event.service) return out;

    const auto route = routes_.lookup(*event.service);
    if (!route) return out; // not a local service (or not known yet)

    const auto prev = nodes_.resolve(event.old_nodes, route->family);
    const auto next = nodes_.resolve(event.new_nodes, route->family);
    auto d = diff_addresses(prev, next);
    if (d.empty()) return out;

    const std::string pool = local_service_pool_name(*event.service, route->family);
    if (!d.added.empty()) {
        out.push_back(Operation::create(*event.service, route->load_balancer, pool,
                                        OpKind::AddIPs, std::move(d.added)));
    }
    if (!d.removed.empty()) {
        out.push_back(Operation::create(*event.service, route->load_balancer, pool,
                                        OpKind::RemoveIPs, std::move(d.removed)));
    }
    for (const auto& op : out) sink_.enqueue(op);
    return out;
}

} // namespace poolsync::reconcile
