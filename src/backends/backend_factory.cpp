#include "ibackend.hpp"
#include "local_process_backend.hpp"
#include "remote_backend.hpp"
#include <iostream>

std::unique_ptr<IBackend> make_backend(const RuntimeConfig& config) {
    auto availability = config.availability();
    if (!availability.available()) {
        std::cerr << "[runtime] Sandbox backend unavailable: " << availability.reason << std::endl;
        return nullptr;
    }

    switch (config.backend) {
    case BackendKind::remote: {
        auto url = parse_service_url(config.service_url);
        if (!url) return nullptr;
        return std::make_unique<RemoteBackend>(*url, config.api_key,
                                               std::chrono::milliseconds(config.health_timeout_ms),
                                               config.tls_insecure);
    }
    case BackendKind::local:
        return std::make_unique<LocalProcessBackend>(config.local_runtime_path, config.resolved_temp_dir());
    case BackendKind::none:
        break;
    }
    return nullptr;
}
