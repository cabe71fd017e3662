#pragma once
/**
 * @file pool_merger.hpp
 * @brief Grouping of drained operations and in-memory merge against a pool snapshot.
 * @details Pure functions: no I/O, no locking. The retry controller calls
 *          merge_operations() once per fetch, with the same operation list.
 */

#include <string>
#include <vector>

#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/reconcile/operation.hpp"

namespace poolsync::reconcile {

/** @struct PoolGroup
 *  @brief Every drained operation targeting one (load balancer, pool), in submission order.
 */
struct PoolGroup {
    std::string load_balancer;          ///< Target load balancer
    std::string pool;                   ///< Target pool
    std::vector<OperationPtr> ops;      ///< Insertion order preserved

    /// "lb/pool"
    std::string key() const { return cloud::pool_key(load_balancer, pool); }
};

/**
 * @brief Group operations by load balancer, then by pool, ignoring case.
 * @return Groups ordered by lower-cased (load balancer, pool); operations inside a
 *         group keep their relative order from `ops`. A group is named with the
 *         spelling of its first operation.
 */
std::vector<PoolGroup> group_operations(const std::vector<OperationPtr>& ops);

/**
 * @brief Apply `ops` to `snapshot` in order and return the desired pool.
 * AddIPs appends missing addresses; RemoveIPs deletes present ones. Both are idempotent.
 */
cloud::BackendPool merge_operations(cloud::BackendPool snapshot, const std::vector<OperationPtr>& ops);

} // namespace poolsync::reconcile
