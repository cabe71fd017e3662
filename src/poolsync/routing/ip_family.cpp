#include "poolsync/routing/ip_family.hpp"
#include "poolsync/routing/service_name.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>

namespace poolsync::routing {

std::optional<IpFamily> family_of(std::string_view ip) noexcept {
    // INET6_ADDRSTRLEN bounds any valid literal; longer input cannot parse.
    if (ip.empty() || ip.size() >= INET6_ADDRSTRLEN) return std::nullopt;
    char text[INET6_ADDRSTRLEN] = {};
    ip.copy(text, ip.size());
    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET,  text, buf) == 1) return IpFamily::IPv4;
    if (inet_pton(AF_INET6, text, buf) == 1) return IpFamily::IPv6;
    return std::nullopt;
}

std::string_view to_string(IpFamily f) noexcept {
    return f == IpFamily::IPv6 ? "IPv6" : "IPv4";
}

std::optional<IpFamily> parse_ip_family(std::string_view s) noexcept {
    if (iequals(s, "ipv4")) return IpFamily::IPv4;
    if (iequals(s, "ipv6")) return IpFamily::IPv6;
    return std::nullopt;
}

} // namespace poolsync::routing
