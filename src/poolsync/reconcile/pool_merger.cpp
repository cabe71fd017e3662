/**
* @file pool_merger.cpp
 * @brief Implementation of group_operations and merge_operations.
 */
#include "poolsync/reconcile/pool_merger.hpp"
#include "poolsync/routing/service_name.hpp"

#include <map>
#include <utility>

namespace poolsync::reconcile {

std::vector<PoolGroup> group_operations(const std::vector<OperationPtr>& ops) {
    // Keyed on lower-cased (lb, pool): remote names compare case-insensitively, so
    // "LB1/pool1" and "lb1/pool1" are one pool and must be one group.
    // std::map keeps the dispatch order deterministic.
    std::map<std::pair<std::string, std::string>, PoolGroup> by_pool;
    for (const auto& op : ops) {
        if (!op) continue;
        auto key = std::make_pair(routing::to_lower(op->load_balancer()), routing::to_lower(op->pool()));
        auto it = by_pool.find(key);
        if (it == by_pool.end()) {
            // The first operation's spelling names the group.
            it = by_pool.emplace(std::move(key),
                                 PoolGroup{.load_balancer = op->load_balancer(), .pool = op->pool(), .ops = {}})
                     .first;
        }
        it->second.ops.push_back(op);
    }

    std::vector<PoolGroup> out;
    out.reserve(by_pool.size());
    for (auto& [key, group] : by_pool) out.push_back(std::move(group));
    return out;
}

cloud::BackendPool merge_operations(cloud::BackendPool snapshot, const std::vector<OperationPtr>& ops) {
    for (const auto& op : ops) {
        switch (op->kind()) {
            case OpKind::AddIPs:    (void)snapshot.add_ips(op->ips()); break;
            case OpKind::RemoveIPs: (void)snapshot.remove_ips(op->ips()); break;
        }
    }
    return snapshot;
}

} // namespace poolsync::reconcile
