#pragma once
#include <cstdint>
#include <string>

enum class BackendKind { none, remote, local };

std::string to_string(BackendKind kind);

struct Availability {
    enum class State { available, not_available, misconfigured };
    State state = State::not_available;
    std::string reason;

    bool available() const { return state == State::available; }
};

// Process-wide settings. Built once at startup and only read afterwards.
struct RuntimeConfig {
    BackendKind backend = BackendKind::none;
    std::string service_url;
    std::string api_key;
    uint32_t default_timeout_ms = 5000;
    uint32_t max_timeout_ms = 30000;
    uint64_t memory_limit_bytes = 128ull * 1024 * 1024;
    std::string local_runtime_path = "wasmedge";
    std::string temp_dir;                       // empty means <system tmp>/wasmbox
    std::string function_name = "main";
    uint32_t health_timeout_ms = 5000;
    std::string compiler_path;
    bool tls_insecure = false;                  // skip certificate checks for https services

    // WASMBOX_BACKEND wins; otherwise a service URL selects the remote
    // backend and WASMEDGE_ENABLED=true selects the local one.
    static RuntimeConfig from_env();

    Availability availability() const;

    // Requested timeout after defaulting (0) and clamping to max_timeout_ms.
    uint32_t effective_timeout(uint32_t requested_ms) const;

    std::string resolved_temp_dir() const;
};
