#pragma once
/**
 * @file ip_family.hpp
 * @brief IP family of a local service and of textual addresses.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace poolsync::routing {

/** @enum IpFamily
 *  @brief Address family a local service is published on.
 */
enum class IpFamily : std::uint8_t { IPv4 = 0, IPv6 = 1 };

/// Family of a textual IP literal; std::nullopt if it is not a valid address.
[[nodiscard]] std::optional<IpFamily> family_of(std::string_view ip) noexcept;

/// "IPv4" / "IPv6".
[[nodiscard]] std::string_view to_string(IpFamily f) noexcept;

/// Case-insensitive parse of "IPv4" / "IPv6".
[[nodiscard]] std::optional<IpFamily> parse_ip_family(std::string_view s) noexcept;

} // namespace poolsync::routing
