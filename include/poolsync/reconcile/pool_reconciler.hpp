#pragma once
/**
 * @file pool_reconciler.hpp
 * @brief Fetch → merge → apply for one pool group, with single-retry policy.
 * @details Failure classes (see CloudError):
 *   - 404 on fetch: the pool is gone, nothing to reconcile; every operation succeeds.
 *   - retriable:    one re-fetch + re-merge + re-apply cycle for the whole group.
 *   - anything else, or a retriable failure on the retry: terminal for this tick.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "poolsync/cloud/pool_client.hpp"
#include "poolsync/config/constants.hpp"
#include "poolsync/obs/observability.hpp"
#include "poolsync/reconcile/pool_merger.hpp"

namespace poolsync::reconcile {

/** @struct ReconcileOptions
 *  @brief Knobs of the per-group fetch/merge/apply sequence.
 */
struct ReconcileOptions {
    bool     skip_unchanged{poolsync::config::constants::SKIP_UNCHANGED_POOLS_DEFAULT}; ///< Skip update on no-op merge
    uint32_t retry_budget{poolsync::config::constants::GROUP_RETRY_BUDGET};            ///< Retry cycles per group
};

/** @enum GroupOutcome
 *  @brief How a pool group ended.
 */
enum class GroupOutcome : uint8_t {
    Updated,    ///< Remote update issued and accepted
    Unchanged,  ///< Merge was a no-op, no update issued
    NotFound,   ///< Pool absent remotely, operations resolved as success
    Failed      ///< Terminal error surfaced to every operation
};

const char* to_string(GroupOutcome o) noexcept;

/** @struct GroupReport
 *  @brief Result of reconciling one pool group.
 */
struct GroupReport {
    std::string  pool_key;                      ///< "lb/pool"
    GroupOutcome outcome{GroupOutcome::Failed};
    uint32_t     attempts{0};                   ///< Fetch attempts made (1 or 2)
    std::size_t  operations{0};                 ///< Operations resolved
    std::optional<cloud::CloudError> error;     ///< Terminal remote error, if the failure came from the cloud
    std::string  reason;                        ///< Failure text (Failed only)
};

/** @class PoolReconciler
 *  @brief Stateless between calls; one instance is shared by all group tasks of a tick.
 */
class PoolReconciler {
public:
    /**
     * @param client   Remote pool API (must be safe for concurrent calls).
     * @param observer Event sink; may be nullptr.
     */
    PoolReconciler(cloud::PoolClient& client, obs::Observer* observer, ReconcileOptions opts = {}) noexcept
        : client_(client), observer_(observer), opts_(opts) {}

    /**
     * @brief Reconcile one group and resolve every one of its operations exactly once.
     * Operations must already be in Applying state.
     */
    GroupReport reconcile(const PoolGroup& group) const;

    /// Resolve every operation of `group` with `err` (used when the group could not run).
    void fail_group(const PoolGroup& group, const OperationError& err) const;

    const ReconcileOptions& options() const noexcept { return opts_; }

private:
    GroupReport finish_success(const PoolGroup& group, GroupOutcome outcome, uint32_t attempts,
                               const char* reason) const;
    GroupReport finish_failure(const PoolGroup& group, const cloud::CloudError& err, uint32_t attempts,
                               const char* stage) const;
    void emit(obs::EventKind kind, const PoolGroup& group, std::string reason) const;

    cloud::PoolClient& client_;
    obs::Observer*     observer_;
    ReconcileOptions   opts_;
};

} // namespace poolsync::reconcile
