#include "service_url.hpp"
#include <algorithm>
#include <cctype>

std::string ServiceUrl::host_header() const {
    bool default_port = (protocol == "https" && port == "443") || (protocol == "http" && port == "80");
    return default_port ? host : host + ":" + port;
}

std::optional<ServiceUrl> parse_service_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ServiceUrl u;
    u.protocol = url.substr(0, scheme_end);
    std::transform(u.protocol.begin(), u.protocol.end(), u.protocol.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (u.protocol != "http" && u.protocol != "https") return std::nullopt;

    std::string rest = url.substr(scheme_end + 3);
    std::string hostport = rest;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        hostport = rest.substr(0, slash);
        u.base_path = rest.substr(slash);
    }
    while (!u.base_path.empty() && u.base_path.back() == '/') u.base_path.pop_back();

    auto colon = hostport.rfind(':');
    if (colon != std::string::npos && hostport.find(']') == std::string::npos) {
        u.host = hostport.substr(0, colon);
        u.port = hostport.substr(colon + 1);
        if (u.port.empty() || !std::all_of(u.port.begin(), u.port.end(),
                                           [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    } else {
        u.host = hostport;
        u.port = u.use_ssl() ? "443" : "80";
    }
    if (u.host.empty()) return std::nullopt;
    return u;
}
