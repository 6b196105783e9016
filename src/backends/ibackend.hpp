#pragma once
#include "../cancellation.hpp"
#include "../execution_types.hpp"
#include "../runtime_config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class IBackend {
public:
    using json = nlohmann::json;
    virtual ~IBackend() = default;

    virtual std::string name() const = 0;

    // Runs one compiled module. Implementations report failures through the
    // result and return promptly once `cancel` fires.
    virtual DispatchResult dispatch(const CompiledArtifact& artifact, const json& input,
                                    const ExecutionLimits& limits, CancellationToken& cancel) = 0;

    // Readiness check, independent of dispatch.
    virtual bool health_check() = 0;
};

// Builds the backend selected by the config, or nullptr when none is usable.
std::unique_ptr<IBackend> make_backend(const RuntimeConfig& config);
