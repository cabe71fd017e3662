#pragma once
/**
 * @file pending_queue.hpp
 * @brief Unbounded multi-producer buffer of not-yet-applied operations.
 *
 * Design goals:
 *  - push() never blocks on I/O; producers contend only on a short critical section.
 *  - drain() swaps the whole buffer with an empty one, so no push is lost and
 *    no operation is drained twice.
 *  - Insertion order is preserved; the drain cycle relies on it for merges.
 *  - close() atomically rejects further pushes and hands back what is left.
 */

#include <cstddef>
#include <mutex>
#include <string_view>
#include <vector>

#include "poolsync/reconcile/operation.hpp"

namespace poolsync::reconcile {

class PendingQueue final {
public:
  /// Append an operation. Returns false (and does not take it) once closed.
  bool push(OperationPtr op);

  /**
   * @brief Remove every pending operation of `service_key` (case-insensitive).
   * Removed operations are marked Withdrawn and returned.
   */
  std::vector<OperationPtr> withdraw(std::string_view service_key);

  /// Swap-and-clear: return every pending operation in insertion order.
  std::vector<OperationPtr> drain();

  /// Reject further pushes and return what was still pending.
  std::vector<OperationPtr> close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const { return size() == 0; }

private:
  mutable std::mutex mu_;
  std::vector<OperationPtr> ops_;
  bool closed_{false};
};

} // namespace poolsync::reconcile
