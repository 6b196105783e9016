#include "runtime_config.hpp"
#include "service_url.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

template <typename T>
static T env_number(const char* name, T fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != std::char_traits<char>::length(v) || parsed > std::numeric_limits<T>::max()) {
            throw std::out_of_range(name);
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid value for " << name << ": '" << v << "'" << std::endl;
        return fallback;
    }
}

std::string to_string(BackendKind kind) {
    switch (kind) {
    case BackendKind::remote: return "remote";
    case BackendKind::local: return "local";
    case BackendKind::none: return "none";
    }
    return "none";
}

RuntimeConfig RuntimeConfig::from_env() {
    RuntimeConfig c;
    c.service_url = env_or("WASMEDGE_SERVICE_URL", "");
    c.api_key = env_or("WASMEDGE_API_KEY", "");
    c.local_runtime_path = env_or("WASMEDGE_PATH", c.local_runtime_path);
    c.default_timeout_ms = env_number<uint32_t>("WASMBOX_DEFAULT_TIMEOUT_MS", c.default_timeout_ms);
    c.max_timeout_ms = env_number<uint32_t>("WASMBOX_MAX_TIMEOUT_MS", c.max_timeout_ms);
    c.memory_limit_bytes = env_number<uint64_t>("WASMBOX_MEMORY_LIMIT", c.memory_limit_bytes);
    c.temp_dir = env_or("WASMBOX_TEMP_DIR", "");
    c.function_name = env_or("WASMBOX_FUNCTION", c.function_name);
    c.compiler_path = env_or("WASMBOX_COMPILER", "");
    c.tls_insecure = lower(env_or("WASMBOX_TLS_INSECURE", "")) == "true";

    std::string selected = lower(env_or("WASMBOX_BACKEND", ""));
    if (selected == "remote") {
        c.backend = BackendKind::remote;
    } else if (selected == "local") {
        c.backend = BackendKind::local;
    } else if (selected == "none") {
        c.backend = BackendKind::none;
    } else {
        if (!selected.empty()) {
            std::cerr << "[config] Unknown WASMBOX_BACKEND '" << selected << "', selecting automatically" << std::endl;
        }
        if (!c.service_url.empty()) {
            c.backend = BackendKind::remote;
        } else if (lower(env_or("WASMEDGE_ENABLED", "")) == "true") {
            c.backend = BackendKind::local;
        }
    }

    std::cout << "[config] backend=" << to_string(c.backend)
              << " default_timeout=" << c.default_timeout_ms << "ms"
              << " max_timeout=" << c.max_timeout_ms << "ms"
              << " memory_limit=" << c.memory_limit_bytes << std::endl;
    return c;
}

Availability RuntimeConfig::availability() const {
    using State = Availability::State;
    switch (backend) {
    case BackendKind::none:
        return {State::not_available,
                "no sandbox backend configured; set WASMEDGE_SERVICE_URL or WASMEDGE_ENABLED=true"};
    case BackendKind::remote:
        if (service_url.empty()) return {State::misconfigured, "remote backend selected but WASMEDGE_SERVICE_URL is empty"};
        if (!parse_service_url(service_url)) return {State::misconfigured, "invalid sandbox service URL: " + service_url};
        break;
    case BackendKind::local:
        if (local_runtime_path.empty()) return {State::misconfigured, "local backend selected but WASMEDGE_PATH is empty"};
        break;
    }
    if (max_timeout_ms == 0) return {State::misconfigured, "maximum timeout must be positive"};
    if (default_timeout_ms == 0) return {State::misconfigured, "default timeout must be positive"};
    return {State::available, ""};
}

uint32_t RuntimeConfig::effective_timeout(uint32_t requested_ms) const {
    uint32_t t = requested_ms == 0 ? default_timeout_ms : requested_ms;
    return std::min(t, max_timeout_ms);
}

std::string RuntimeConfig::resolved_temp_dir() const {
    if (!temp_dir.empty()) return temp_dir;
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) base = "/tmp";
    return (base / "wasmbox").string();
}
