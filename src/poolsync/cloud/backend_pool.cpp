/**
* @file backend_pool.cpp
 * @brief Idempotent address mutations on a BackendPool.
 */
#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/config/constants.hpp"

#include <algorithm>

namespace poolsync::cloud {

bool BackendPool::has_ip(std::string_view ip) const noexcept {
    return std::any_of(addresses.begin(), addresses.end(),
                       [&](const BackendAddress& a) { return a.ip_address == ip; });
}

bool BackendPool::add_ips(const IpSet& ips) {
    bool changed = false;
    for (const auto& ip : ips) {
        if (ip.empty() || has_ip(ip)) continue;
        addresses.push_back(BackendAddress{.name = ip, .ip_address = ip});
        changed = true;
    }
    return changed;
}

bool BackendPool::remove_ips(const IpSet& ips) {
    const auto before = addresses.size();
    std::erase_if(addresses, [&](const BackendAddress& a) { return ips.contains(a.ip_address); });
    return addresses.size() != before;
}

IpSet BackendPool::ip_set() const {
    IpSet out;
    for (const auto& a : addresses) out.insert(a.ip_address);
    return out;
}

std::string pool_key(std::string_view load_balancer, std::string_view pool) {
    std::string key;
    key.reserve(load_balancer.size() + pool.size() + 1);
    key.append(load_balancer);
    key.push_back(config::constants::POOL_KEY_SEPARATOR);
    key.append(pool);
    return key;
}

} // namespace poolsync::cloud
