/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer for bring-up.
 */
#include "poolsync/obs/observability.hpp"
#include "poolsync/config/constants.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace poolsync::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Enqueued:      return "enqueued";
            case EventKind::Withdrawn:     return "withdrawn";
            case EventKind::Tick:          return "tick";
            case EventKind::StaleDropped:  return "stale_dropped";
            case EventKind::PoolUpdated:   return "pool_updated";
            case EventKind::PoolUnchanged: return "pool_unchanged";
            case EventKind::PoolNotFound:  return "pool_not_found";
            case EventKind::Retry:         return "retry";
            case EventKind::PoolFailed:    return "pool_failed";
            case EventKind::Shutdown:      return "shutdown";
        }
        return "unknown";
    }

    void accumulate(Counters& c, const ReconcileEvent& e) noexcept {
        switch (e.kind) {
            case EventKind::Enqueued:      c.enqueued += e.count; break;
            case EventKind::Withdrawn:     c.withdrawn += e.count; break;
            case EventKind::Tick:          c.ticks++; c.drained += e.count; break;
            case EventKind::StaleDropped:  c.stale_dropped += e.count; break;
            case EventKind::PoolUpdated:   c.pool_updates++; break;
            case EventKind::PoolUnchanged: c.pool_unchanged++; break;
            case EventKind::PoolNotFound:  c.pool_not_found++; break;
            case EventKind::Retry:         c.retries++; break;
            case EventKind::PoolFailed:    c.failures++; break;
            case EventKind::Shutdown:      c.shutdown_resolved += e.count; break;
        }
    }

    namespace {
        std::atomic<bool> g_output{config::constants::EMIT_EVENTS_DEFAULT};
    }

    class SimpleObserver : public Observer {
    public:
        void record(const ReconcileEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            accumulate(ctr_, e);
            if (!g_output.load(std::memory_order_relaxed)) return;
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"event":"%s","pool":"%s","service":"%s","count":%zu,"reason":"%s"})" "\n",
              to_string(e.kind), e.pool_key.c_str(), e.service.c_str(), e.count, e.reason.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    void set_simple_observer_output(bool enabled) {
        g_output.store(enabled, std::memory_order_relaxed);
    }

} // namespace poolsync::obs
