#pragma once
// poolsync: shared pieces of the RCU tables (ServiceRoutingTable, NodeIpResolver).

#include <cstddef>
#include <functional>
#include <string_view>

namespace poolsync::routing {

// -----------------------------------------------------------------------------
// Error codes returned by table mutations. Never throw exceptions on this path.
// -----------------------------------------------------------------------------
/// Result codes for table mutations.
enum class RegistryErr {
    Ok,         ///< Mutation published.
    NotFound,   ///< Target key not present.
    Invalid     ///< Input validation failed (empty key, bad IP, empty LB name).
};

// Transparent hash/equal functors enable heterogeneous lookup with string_view
// (avoids constructing std::string temporaries for every query).
struct SKeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};
struct SKeyEq {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace poolsync::routing
