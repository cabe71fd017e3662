/**
* @file backend_pool_updater.cpp
 * @brief Drain loop, route validation and per-group dispatch.
 */
#include "poolsync/reconcile/backend_pool_updater.hpp"

#include <exception>
#include <future>
#include <system_error>
#include <utility>

namespace poolsync::reconcile {

BackendPoolUpdater::BackendPoolUpdater(cloud::PoolClient& client,
                                       const routing::ServiceRoutingTable* routes,
                                       UpdaterConfig cfg,
                                       obs::Observer* observer)
    : client_(client),
      routes_(routes),
      cfg_(cfg),
      observer_(observer),
      reconciler_(client, observer, ReconcileOptions{.skip_unchanged = cfg.skip_unchanged_pools}) {}

BackendPoolUpdater::~BackendPoolUpdater() {
    stop();
}

void BackendPoolUpdater::emit(obs::EventKind kind, std::string service, std::size_t count, std::string reason) {
    if (!observer_) return;
    observer_->record(obs::ReconcileEvent{
        .kind = kind,
        .service = std::move(service),
        .count = count,
        .reason = std::move(reason),
    });
}

//------------------------------- Producers -------------------------------------

void BackendPoolUpdater::enqueue(OperationPtr op) {
    if (!op) return;
    if (!queue_.push(op)) {
        (void)op->mark_applying();
        (void)op->resolve(OperationResult::failure(
            op->pool_key(), OperationError{.code = OperationErrc::Shutdown, .message = "updater stopped"}));
        emit(obs::EventKind::Shutdown, op->service_key(), 1, "enqueue after stop");
        return;
    }
    emit(obs::EventKind::Enqueued, op->service_key(), 1,
         std::string(to_string(op->kind())) + " " + op->pool_key());
}

std::size_t BackendPoolUpdater::withdraw(std::string_view service_key) {
    const auto removed = queue_.withdraw(service_key);
    if (!removed.empty()) {
        emit(obs::EventKind::Withdrawn, std::string(service_key), removed.size(), "withdrawn before drain");
    }
    return removed.size();
}

//------------------------------- Lifecycle -------------------------------------

void BackendPoolUpdater::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (queue_.closed() || running_.load(std::memory_order_acquire)) return;
    {
        std::lock_guard<std::mutex> cv_lk(cv_mu_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&BackendPoolUpdater::run_loop, this);
    running_.store(true, std::memory_order_release);
}

void BackendPoolUpdater::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    {
        std::lock_guard<std::mutex> cv_lk(cv_mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join(); // in-flight tick runs to completion
    running_.store(false, std::memory_order_release);

    auto left = queue_.close();
    if (left.empty()) return;
    const OperationError err{.code = OperationErrc::Shutdown, .message = "updater stopped before drain"};
    for (const auto& op : left) {
        (void)op->mark_applying();
        (void)op->resolve(OperationResult::failure(op->pool_key(), err));
    }
    emit(obs::EventKind::Shutdown, {}, left.size(), err.message);
}

void BackendPoolUpdater::run_loop() {
    std::unique_lock<std::mutex> lk(cv_mu_);
    while (!stop_requested_) {
        if (cv_.wait_for(lk, cfg_.drain_interval, [this] { return stop_requested_; })) break;
        lk.unlock();
        (void)process_once();
        lk.lock();
    }
}

//------------------------------- Drain tick ------------------------------------

std::vector<OperationPtr> BackendPoolUpdater::validate(std::vector<OperationPtr> drained, std::size_t& stale) {
    if (!cfg_.validate_routes || !routes_) return drained;

    std::vector<OperationPtr> live;
    live.reserve(drained.size());
    for (auto& op : drained) {
        const auto route = routes_->lookup(op->service_key());
        std::string reason;
        if (!route) {
            reason = "service is no longer local";
        } else if (!routing::iequals(route->load_balancer, op->load_balancer())) {
            reason = "service moved to load balancer " + route->load_balancer;
        } else {
            live.push_back(std::move(op));
            continue;
        }
        (void)op->resolve(OperationResult::failure(
            op->pool_key(), OperationError{.code = OperationErrc::StaleRoute, .message = reason}));
        emit(obs::EventKind::StaleDropped, op->service_key(), 1, reason);
        ++stale;
    }
    return live;
}

GroupReport BackendPoolUpdater::run_group(const PoolGroup& group) const {
    try {
        return reconciler_.reconcile(group);
    } catch (const std::exception& e) {
        return fail_internal(group, e.what());
    } catch (...) {
        // Not a std::exception: still fail the group so no operation is left unresolved.
        return fail_internal(group, "unknown exception");
    }
}

GroupReport BackendPoolUpdater::fail_internal(const PoolGroup& group, std::string message) const {
    const OperationError err{.code = OperationErrc::Internal, .message = std::move(message)};
    reconciler_.fail_group(group, err);
    return GroupReport{.pool_key = group.key(), .outcome = GroupOutcome::Failed, .attempts = 0,
                       .operations = group.ops.size(), .error = std::nullopt, .reason = err.to_string()};
}

TickReport BackendPoolUpdater::process_once() {
    std::lock_guard<std::mutex> tick(tick_mu_);
    TickReport report;

    // 1) Swap the queue out; anything enqueued from now on waits for the next tick.
    auto drained = queue_.drain();
    report.drained = drained.size();
    if (drained.empty()) return report;
    for (const auto& op : drained) (void)op->mark_applying();

    // 2) Drop operations whose routing changed since they were produced.
    auto live = validate(std::move(drained), report.stale_dropped);

    // 3) One task per (lb, pool); sequential inside a group.
    const auto groups = group_operations(live);
    std::vector<std::future<GroupReport>> inflight;
    inflight.reserve(groups.size());
    for (const auto& g : groups) {
        try {
            inflight.push_back(std::async(std::launch::async, [this, &g] { return run_group(g); }));
        } catch (const std::system_error&) {
            // No thread available: run this group on the tick thread.
            report.groups.push_back(run_group(g));
        }
    }
    for (auto& f : inflight) report.groups.push_back(f.get());

    emit(obs::EventKind::Tick, {}, report.drained,
         std::to_string(report.groups.size()) + " groups, " + std::to_string(report.stale_dropped) + " stale");
    return report;
}

} // namespace poolsync::reconcile
