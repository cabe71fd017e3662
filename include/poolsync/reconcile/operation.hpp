/**
 * @file operation.hpp
 * @brief A single requested mutation against one backend pool.
 *
 * An Operation is immutable after creation except for its lifecycle state and
 * its completion signal. The signal is a single-resolution promise: the first
 * call to resolve() wins, later calls are rejected, so every operation
 * completes exactly once whichever path (not-found short-circuit, success,
 * retry, terminal failure, stale route, shutdown) reaches it first.
 *
 * Lifecycle:
 *   Pending ──withdraw──▶ Withdrawn            (terminal, never signalled)
 *   Pending ──drain─────▶ Applying ──▶ Succeeded | Failed
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/cloud/cloud_error.hpp"
#include "poolsync/routing/service_name.hpp"

namespace poolsync::reconcile {

/// Mutation requested against a pool.
enum class OpKind : std::uint8_t { AddIPs = 0, RemoveIPs = 1 };

/// Lifecycle state of an operation.
enum class OpState : std::uint8_t { Pending, Withdrawn, Applying, Succeeded, Failed };

const char* to_string(OpKind k) noexcept;
const char* to_string(OpState s) noexcept;

/// Why an operation failed.
enum class OperationErrc : std::uint8_t {
  Cloud,       ///< Remote call failed; see `cloud`
  StaleRoute,  ///< Service no longer local, or assigned to another load balancer
  Shutdown,    ///< Updater stopped before the operation was applied
  Internal     ///< A collaborator threw
};

struct OperationError final {
  OperationErrc code{OperationErrc::Internal};
  std::optional<cloud::CloudError> cloud;  ///< Set when code == Cloud
  std::string message;

  [[nodiscard]] std::string to_string() const;

  static OperationError from_cloud(const cloud::CloudError& e);
};

/**
 * @brief Terminal outcome delivered by Operation::wait().
 */
struct OperationResult final {
  std::string pool_key;                ///< "lb/pool"
  bool ok{false};
  std::optional<OperationError> error; ///< Set iff !ok

  static OperationResult success(std::string pool_key);
  static OperationResult failure(std::string pool_key, OperationError err);
};

class Operation;
using OperationPtr = std::shared_ptr<Operation>;

class Operation final {
public:
  /// Build a pending operation. Operations are always shared: the producer
  /// keeps one handle to wait on, the queue and the drain cycle hold others.
  static OperationPtr create(routing::ServiceName service, std::string load_balancer,
                             std::string pool, OpKind kind, cloud::IpSet ips);

  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  const routing::ServiceName& service() const noexcept { return service_; }
  const std::string& service_key() const noexcept { return service_key_; }
  const std::string& load_balancer() const noexcept { return load_balancer_; }
  const std::string& pool() const noexcept { return pool_; }
  OpKind kind() const noexcept { return kind_; }
  const cloud::IpSet& ips() const noexcept { return ips_; }

  /// Process-wide creation sequence number (monotonic).
  std::uint64_t sequence() const noexcept { return sequence_; }

  /// "lb/pool" this operation targets.
  [[nodiscard]] std::string pool_key() const;

  OpState state() const noexcept { return state_.load(std::memory_order_acquire); }

  /// True once the completion signal has been resolved.
  [[nodiscard]] bool done() const noexcept;

  /// Block until the operation reaches Succeeded or Failed.
  /// Never returns for a withdrawn operation; use wait_for() when that can happen.
  OperationResult wait() const;

  /// Bounded wait. std::nullopt on timeout.
  std::optional<OperationResult> wait_for(std::chrono::milliseconds timeout) const;

  // ---- lifecycle transitions (driven by the queue / updater) ----

  /// Pending → Withdrawn. Returns false if the operation already left Pending.
  bool mark_withdrawn() noexcept;

  /// Pending → Applying. Returns false if the operation already left Pending.
  bool mark_applying() noexcept;

  /// Resolve the completion signal. Only the first call has an effect.
  /// Returns false if the operation was already resolved or withdrawn.
  bool resolve(OperationResult result);

private:
  Operation(routing::ServiceName service, std::string load_balancer, std::string pool,
            OpKind kind, cloud::IpSet ips);

  bool transition(OpState from, OpState to) noexcept;

  const routing::ServiceName service_;
  const std::string service_key_;
  const std::string load_balancer_;
  const std::string pool_;
  const OpKind kind_;
  const cloud::IpSet ips_;
  const std::uint64_t sequence_;

  std::atomic<OpState> state_{OpState::Pending};
  std::atomic<bool> resolved_{false};
  std::promise<OperationResult> promise_;
  std::shared_future<OperationResult> future_;
};

} // namespace poolsync::reconcile
