// ServiceRoutingTable: RCU Implementation Notes
// Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
// Writers: lock write_mu_, copy current map, mutate, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "poolsync/routing/service_routing_table.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <utility>

namespace poolsync::routing {

std::shared_ptr<const ServiceRoutingTable::Map>
ServiceRoutingTable::snapshot() const noexcept {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

void ServiceRoutingTable::publish(std::shared_ptr<Map> next) noexcept {
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

std::optional<ServiceRoute> ServiceRoutingTable::lookup(std::string_view service_key) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    const std::string key = to_lower(service_key);
    auto it = snap->find(std::string_view{key});
    if (it == snap->end()) return std::nullopt;
    return it->second; // copy
}

std::optional<ServiceRoute> ServiceRoutingTable::lookup(const ServiceName& service) const {
    return lookup(service.key());
}

bool ServiceRoutingTable::is_local(std::string_view service_key) const {
    return lookup(service_key).has_value();
}

std::size_t ServiceRoutingTable::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<std::string> ServiceRoutingTable::list_services() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    return out;
}

RegistryErr ServiceRoutingTable::upsert(const ServiceName& service, ServiceRoute route) {
    if (service.ns.empty() || service.name.empty() || route.load_balancer.empty()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Invalid;
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<Map>(*snapshot()); // copy-on-write
    next->insert_or_assign(service.key(), std::move(route));
    publish(std::move(next));
    upserts_.fetch_add(1, std::memory_order_relaxed);
    return RegistryErr::Ok;
}

bool ServiceRoutingTable::remove(std::string_view service_key) {
    const std::string key = to_lower(service_key);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->find(std::string_view{key}) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(key);
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void ServiceRoutingTable::clear() {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
}

ServiceRoutingTable::Stats ServiceRoutingTable::stats() const noexcept {
    return Stats{
        .upserts  = upserts_.load(std::memory_order_relaxed),
        .removes  = removes_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
    };
}

} // namespace poolsync::routing
