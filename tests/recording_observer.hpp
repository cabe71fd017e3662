/**
 * @file recording_observer.hpp
 * @brief Observer double for tests: keeps every event and the derived counters.
 */
#pragma once

#include <algorithm>
#include <mutex>
#include <vector>

#include "poolsync/obs/observability.hpp"

namespace poolsync::testing {

class RecordingObserver final : public poolsync::obs::Observer {
public:
  void record(const poolsync::obs::ReconcileEvent& e) override {
    std::lock_guard<std::mutex> lk(mu_);
    events_.push_back(e);
    poolsync::obs::accumulate(ctr_, e);
  }

  poolsync::obs::Counters snapshot() const override {
    std::lock_guard<std::mutex> lk(mu_);
    return ctr_;
  }

  std::vector<poolsync::obs::ReconcileEvent> events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
  }

  std::size_t count(poolsync::obs::EventKind k) const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
                                                  [k](const auto& e) { return e.kind == k; }));
  }

private:
  mutable std::mutex mu_;
  std::vector<poolsync::obs::ReconcileEvent> events_;
  poolsync::obs::Counters ctr_;
};

} // namespace poolsync::testing
