/**
 * @file backend_pool.hpp
 * @brief Backend address pool model shared by the cloud client and the reconciler.
 *
 * A pool is the fetched remote definition of one load-balancer backend pool:
 * its name, owning load balancer and the ordered list of address entries.
 * Equality is defaulted so a merged pool can be compared against the fetched
 * snapshot to detect no-op updates.
 */
#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace poolsync::cloud {

/// Ordered, duplicate-free set of textual IP addresses.
using IpSet = std::set<std::string, std::less<>>;

/**
 * @brief One address entry of a backend pool.
 */
struct BackendAddress final {
  /// Address identifier inside the pool (IP literal for entries we create).
  std::string name;

  /// IPv4/IPv6 literal.
  std::string ip_address;

  bool operator==(const BackendAddress&) const = default;
};

using BackendAddressList = std::vector<BackendAddress>;

/**
 * @brief Remote definition of a backend pool.
 */
struct BackendPool final {
  std::string        name;           ///< Pool name, e.g. "default-web"
  std::string        load_balancer;  ///< Owning load balancer name
  BackendAddressList addresses;      ///< Address entries in remote order

  bool operator==(const BackendPool&) const = default;

  /// True if an entry with this IP exists.
  [[nodiscard]] bool has_ip(std::string_view ip) const noexcept;

  /// Append entries for IPs not yet present. Returns true if the list changed.
  bool add_ips(const IpSet& ips);

  /// Erase entries whose IP is in `ips`. Returns true if the list changed.
  bool remove_ips(const IpSet& ips);

  /// IPs currently in the pool, as a set.
  [[nodiscard]] IpSet ip_set() const;
};

/// "lb/pool" key used for grouping, logging and operation results.
[[nodiscard]] std::string pool_key(std::string_view load_balancer, std::string_view pool);

} // namespace poolsync::cloud
