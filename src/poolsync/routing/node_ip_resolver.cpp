#include "poolsync/routing/node_ip_resolver.hpp"
#include "poolsync/routing/service_name.hpp"

#include <memory>
#include <utility>

namespace poolsync::routing {

std::shared_ptr<const NodeIpResolver::Map> NodeIpResolver::snapshot() const noexcept {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

void NodeIpResolver::publish(std::shared_ptr<Map> next) noexcept {
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

bool NodeIpResolver::validate_ips(const cloud::IpSet& ips) noexcept {
    for (const auto& ip : ips) {
        if (!family_of(ip)) return false;
    }
    return true;
}

cloud::IpSet NodeIpResolver::ips_of(std::string_view node) const {
    auto snap = snapshot();
    const std::string key = to_lower(node);
    auto it = snap->find(std::string_view{key});
    if (it == snap->end()) return {};
    return it->second;
}

cloud::IpSet NodeIpResolver::resolve(const NodeSet& nodes, std::optional<IpFamily> family) const {
    cloud::IpSet out;
    auto snap = snapshot(); // one snapshot for the whole resolution
    for (const auto& node : nodes) {
        const std::string key = to_lower(node);
        auto it = snap->find(std::string_view{key});
        if (it == snap->end()) continue;
        for (const auto& ip : it->second) {
            if (family && family_of(ip) != family) continue;
            out.insert(ip);
        }
    }
    return out;
}

std::size_t NodeIpResolver::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

RegistryErr NodeIpResolver::set_node_ips(std::string_view node, const cloud::IpSet& ips) {
    if (node.empty() || !validate_ips(ips)) return RegistryErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<Map>(*snapshot());
    if (ips.empty()) {
        next->erase(to_lower(node));
    } else {
        next->insert_or_assign(to_lower(node), ips);
    }
    publish(std::move(next));
    return RegistryErr::Ok;
}

RegistryErr NodeIpResolver::add_node_ip(std::string_view node, std::string_view ip) {
    if (node.empty() || !family_of(ip)) return RegistryErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<Map>(*snapshot());
    (*next)[to_lower(node)].insert(std::string(ip));
    publish(std::move(next));
    return RegistryErr::Ok;
}

RegistryErr NodeIpResolver::remove_node_ip(std::string_view node, std::string_view ip) {
    const std::string key = to_lower(node);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto cur = snap->find(std::string_view{key});
    if (cur == snap->end() || !cur->second.contains(ip)) return RegistryErr::NotFound;

    auto next = std::make_shared<Map>(*snap);
    auto it = next->find(std::string_view{key});
    it->second.erase(it->second.find(ip));
    if (it->second.empty()) next->erase(it);
    publish(std::move(next));
    return RegistryErr::Ok;
}

bool NodeIpResolver::remove_node(std::string_view node) {
    const std::string key = to_lower(node);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(std::string_view{key}) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(key);
    publish(std::move(next));
    return true;
}

} // namespace poolsync::routing
