#include "poolsync/routing/service_name.hpp"

#include <algorithm>

namespace poolsync::routing {

static char lower_ascii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), lower_ascii);
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower_ascii(a[i]) != lower_ascii(b[i])) return false;
    }
    return true;
}

std::string ServiceName::key() const {
    std::string k;
    k.reserve(ns.size() + name.size() + 1);
    k += to_lower(ns);
    k += '/';
    k += to_lower(name);
    return k;
}

std::optional<ServiceName> ServiceName::parse(std::string_view qualified) {
    const auto slash = qualified.find('/');
    if (slash == std::string_view::npos) return std::nullopt;
    auto ns   = qualified.substr(0, slash);
    auto name = qualified.substr(slash + 1);
    if (ns.empty() || name.empty() || name.find('/') != std::string_view::npos) return std::nullopt;
    return ServiceName{.ns = std::string(ns), .name = std::string(name)};
}

} // namespace poolsync::routing
