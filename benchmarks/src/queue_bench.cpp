/**
 * @file queue_bench.cpp
 * @brief Microbenchmark for PendingQueue (N producers / 1 draining consumer).
 *
 * Producers push pre-built operations as fast as they can while one consumer
 * repeatedly swaps the queue out, the same access pattern as the drain tick.
 *
 * Reports: items/sec, drains performed, and ns per enqueued item.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "poolsync/reconcile/pending_queue.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

using poolsync::reconcile::OpKind;
using poolsync::reconcile::Operation;
using poolsync::reconcile::OperationPtr;
using poolsync::reconcile::PendingQueue;

struct Result {
  std::string name;             // e.g., "producers=4"
  std::size_t N = 0;            // total items pushed
  std::size_t drains = 0;       // non-empty drains observed
  double      seconds = 0.0;    // wall time
  double      items_per_s = 0.0;
  double      ns_per_item = 0.0;
};

// Operations are built up front so the run measures queue contention only.
std::vector<OperationPtr> make_ops(std::size_t n, std::size_t producer) {
  std::vector<OperationPtr> ops;
  ops.reserve(n);
  const poolsync::routing::ServiceName svc{.ns = "bench", .name = "svc" + std::to_string(producer)};
  for (std::size_t i = 0; i < n; ++i) {
    ops.push_back(Operation::create(svc, "lb1", "pool" + std::to_string(i % 8), OpKind::AddIPs,
                                    {"10.0." + std::to_string(producer) + "." + std::to_string(i % 250)}));
  }
  return ops;
}

Result run_one(std::size_t producers, std::size_t per_producer) {
  PendingQueue q;
  std::vector<std::vector<OperationPtr>> inputs;
  inputs.reserve(producers);
  for (std::size_t p = 0; p < producers; ++p) inputs.push_back(make_ops(per_producer, p));

  const std::size_t N = producers * per_producer;
  std::barrier sync(static_cast<std::ptrdiff_t>(producers + 1));
  std::size_t drained = 0, drains = 0;
  clock::time_point t_start, t_end;

  std::vector<std::thread> prods;
  for (std::size_t p = 0; p < producers; ++p) {
    prods.emplace_back([&, p] {
      sync.arrive_and_wait();
      for (auto& op : inputs[p]) (void)q.push(op);
    });
  }

  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    while (drained < N) {
      auto batch = q.drain();
      if (batch.empty()) { std::this_thread::yield(); continue; }
      drained += batch.size();
      ++drains;
    }
    t_end = clock::now();
  });

  for (auto& t : prods) t.join();
  cons.join();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name        = "producers=" + std::to_string(producers);
  r.N           = N;
  r.drains      = drains;
  r.seconds     = seconds;
  r.items_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  r.ns_per_item = (r.items_per_s > 0.0) ? 1e9 / r.items_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(14) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  drains=" << std::setw(8) << r.drains
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  items/s=" << std::setw(12) << r.items_per_s
            << "  ns/item=" << std::setw(10) << r.ns_per_item
            << '\n';
}

} // namespace bench

int main() {
  constexpr std::size_t per_producer = 100'000;
  const std::vector<std::size_t> producer_counts = {1, 2, 4, 8};

  std::cout << "PendingQueue NP/1C microbenchmark (push + swap-drain)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto p : producer_counts) bench::print(bench::run_one(p, per_producer));

  std::cout << std::flush;
  return 0;
}
