/**
 * @file service_name.hpp
 * @brief Service identity and case-insensitive key helpers.
 *
 * Services, nodes and load balancers are matched case-insensitively by the
 * cloud control plane, so every table in this library stores lower-cased keys.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace poolsync::routing {

/// ASCII lower-case copy of `s`.
[[nodiscard]] std::string to_lower(std::string_view s);

/// ASCII case-insensitive equality.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Namespace-qualified service identity.
 */
struct ServiceName final {
  std::string ns;    ///< Namespace, e.g. "default"
  std::string name;  ///< Service name, e.g. "web"

  /// Lower-cased "namespace/name"; the key used by every table.
  [[nodiscard]] std::string key() const;

  /// Parse "namespace/name". Both parts must be non-empty.
  [[nodiscard]] static std::optional<ServiceName> parse(std::string_view qualified);

  bool operator==(const ServiceName&) const = default;
};

} // namespace poolsync::routing
