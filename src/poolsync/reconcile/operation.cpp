/**
* @file operation.cpp
 * @brief Operation lifecycle and single-resolution completion signal.
 */
#include "poolsync/reconcile/operation.hpp"

#include <utility>

namespace poolsync::reconcile {

namespace {
std::atomic<std::uint64_t> g_sequence{0};
}

const char* to_string(OpKind k) noexcept {
    return k == OpKind::AddIPs ? "add_ips" : "remove_ips";
}

const char* to_string(OpState s) noexcept {
    switch (s) {
        case OpState::Pending:   return "pending";
        case OpState::Withdrawn: return "withdrawn";
        case OpState::Applying:  return "applying";
        case OpState::Succeeded: return "succeeded";
        case OpState::Failed:    return "failed";
    }
    return "unknown";
}

std::string OperationError::to_string() const {
    switch (code) {
        case OperationErrc::Cloud:
            return cloud ? cloud->to_string() : message;
        case OperationErrc::StaleRoute: return "stale route: " + message;
        case OperationErrc::Shutdown:   return "shutdown: " + message;
        case OperationErrc::Internal:   return "internal: " + message;
    }
    return message;
}

OperationError OperationError::from_cloud(const cloud::CloudError& e) {
    return OperationError{.code = OperationErrc::Cloud, .cloud = e, .message = e.message};
}

OperationResult OperationResult::success(std::string pool_key) {
    return OperationResult{.pool_key = std::move(pool_key), .ok = true, .error = std::nullopt};
}

OperationResult OperationResult::failure(std::string pool_key, OperationError err) {
    return OperationResult{.pool_key = std::move(pool_key), .ok = false, .error = std::move(err)};
}

OperationPtr Operation::create(routing::ServiceName service, std::string load_balancer,
                               std::string pool, OpKind kind, cloud::IpSet ips) {
    return OperationPtr(new Operation(std::move(service), std::move(load_balancer),
                                      std::move(pool), kind, std::move(ips)));
}

Operation::Operation(routing::ServiceName service, std::string load_balancer, std::string pool,
                     OpKind kind, cloud::IpSet ips)
    : service_(std::move(service)),
      service_key_(service_.key()),
      load_balancer_(std::move(load_balancer)),
      pool_(std::move(pool)),
      kind_(kind),
      ips_(std::move(ips)),
      sequence_(g_sequence.fetch_add(1, std::memory_order_relaxed)),
      future_(promise_.get_future().share()) {}

std::string Operation::pool_key() const {
    return cloud::pool_key(load_balancer_, pool_);
}

bool Operation::done() const noexcept {
    return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

OperationResult Operation::wait() const {
    return future_.get();
}

std::optional<OperationResult> Operation::wait_for(std::chrono::milliseconds timeout) const {
    if (future_.wait_for(timeout) != std::future_status::ready) return std::nullopt;
    return future_.get();
}

bool Operation::transition(OpState from, OpState to) noexcept {
    return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

bool Operation::mark_withdrawn() noexcept {
    return transition(OpState::Pending, OpState::Withdrawn);
}

bool Operation::mark_applying() noexcept {
    return transition(OpState::Pending, OpState::Applying);
}

bool Operation::resolve(OperationResult result) {
    if (state() == OpState::Withdrawn) return false;
    if (resolved_.exchange(true, std::memory_order_acq_rel)) return false;
    state_.store(result.ok ? OpState::Succeeded : OpState::Failed, std::memory_order_release);
    promise_.set_value(std::move(result));
    return true;
}

} // namespace poolsync::reconcile
