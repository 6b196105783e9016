#pragma once
#include <optional>
#include <string>

struct ServiceUrl {
    std::string protocol;   // "http" or "https"
    std::string host;
    std::string port;
    std::string base_path;  // no trailing slash; empty for the root

    bool use_ssl() const { return protocol == "https"; }
    std::string target(const std::string& endpoint) const { return base_path + endpoint; }
    std::string host_header() const;
};

// Parses "http[s]://host[:port][/path]". Returns nullopt for anything else.
std::optional<ServiceUrl> parse_service_url(const std::string& url);
