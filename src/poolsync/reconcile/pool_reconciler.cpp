/**
* @file pool_reconciler.cpp
 * @brief Implementation of the per-group fetch/merge/apply and retry policy.
 */
#include "poolsync/reconcile/pool_reconciler.hpp"

#include <utility>

namespace poolsync::reconcile {

const char* to_string(GroupOutcome o) noexcept {
    switch (o) {
        case GroupOutcome::Updated:   return "updated";
        case GroupOutcome::Unchanged: return "unchanged";
        case GroupOutcome::NotFound:  return "not_found";
        case GroupOutcome::Failed:    return "failed";
    }
    return "unknown";
}

void PoolReconciler::emit(obs::EventKind kind, const PoolGroup& group, std::string reason) const {
    if (!observer_) return;
    observer_->record(obs::ReconcileEvent{
        .kind = kind,
        .pool_key = group.key(),
        .count = group.ops.size(),
        .reason = std::move(reason),
    });
}

GroupReport PoolReconciler::reconcile(const PoolGroup& group) const {
    uint32_t retries_left = opts_.retry_budget;
    uint32_t attempts = 0;

    for (;;) {
        ++attempts;

        // 1) Snapshot of the remote pool
        auto fetched = client_.get_backend_pool(group.load_balancer, group.pool);
        if (!fetched) {
            const cloud::CloudError& err = fetched.error();
            if (err.is_not_found()) {
                // The pool is gone; treat the group as reconciled.
                return finish_success(group, GroupOutcome::NotFound, attempts, "backend pool not found");
            }
            if (err.retriable && retries_left > 0) {
                --retries_left;
                emit(obs::EventKind::Retry, group, "get: " + err.to_string());
                continue;
            }
            return finish_failure(group, err, attempts, "get");
        }

        // 2) Merge every operation of the group in submission order
        cloud::BackendPool desired = merge_operations(*fetched, group.ops);
        if (opts_.skip_unchanged && desired.addresses == fetched->addresses) {
            return finish_success(group, GroupOutcome::Unchanged, attempts, "no change");
        }

        // 3) Apply
        auto applied = client_.create_or_update_backend_pool(group.load_balancer, group.pool, desired);
        if (applied) {
            return finish_success(group, GroupOutcome::Updated, attempts, "updated");
        }
        const cloud::CloudError& err = applied.error();
        if (err.retriable && retries_left > 0) {
            // Re-fetch so the retry merges against any concurrent external change.
            --retries_left;
            emit(obs::EventKind::Retry, group, "put: " + err.to_string());
            continue;
        }
        return finish_failure(group, err, attempts, "put");
    }
}

GroupReport PoolReconciler::finish_success(const PoolGroup& group, GroupOutcome outcome,
                                           uint32_t attempts, const char* reason) const {
    const std::string key = group.key();
    for (const auto& op : group.ops) (void)op->resolve(OperationResult::success(key));

    switch (outcome) {
        case GroupOutcome::Updated:   emit(obs::EventKind::PoolUpdated, group, reason); break;
        case GroupOutcome::Unchanged: emit(obs::EventKind::PoolUnchanged, group, reason); break;
        case GroupOutcome::NotFound:  emit(obs::EventKind::PoolNotFound, group, reason); break;
        case GroupOutcome::Failed:    break;
    }
    return GroupReport{.pool_key = key, .outcome = outcome, .attempts = attempts,
                       .operations = group.ops.size(), .error = std::nullopt};
}

GroupReport PoolReconciler::finish_failure(const PoolGroup& group, const cloud::CloudError& err,
                                           uint32_t attempts, const char* stage) const {
    const std::string key = group.key();
    const OperationError op_err = OperationError::from_cloud(err);
    for (const auto& op : group.ops) (void)op->resolve(OperationResult::failure(key, op_err));

    emit(obs::EventKind::PoolFailed, group, std::string(stage) + ": " + err.to_string());

    return GroupReport{.pool_key = key, .outcome = GroupOutcome::Failed, .attempts = attempts,
                       .operations = group.ops.size(), .error = err,
                       .reason = std::string(stage) + ": " + err.to_string()};
}

void PoolReconciler::fail_group(const PoolGroup& group, const OperationError& err) const {
    const std::string key = group.key();
    for (const auto& op : group.ops) (void)op->resolve(OperationResult::failure(key, err));
    emit(obs::EventKind::PoolFailed, group, err.to_string());
}

} // namespace poolsync::reconcile
