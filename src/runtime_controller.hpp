#pragma once
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "compiler.hpp"
#include "execution_types.hpp"
#include "runtime_config.hpp"
#include "telemetry.hpp"
#include "backends/ibackend.hpp"

// Entry point for sandboxed execution: availability check, compilation,
// dispatch raced against the effective timeout, normalization and tracing.
// Holds no per-call state, so execute() may be called from many threads.
class RuntimeController {
public:
    using json = nlohmann::json;

    // Selects the backend from the config.
    RuntimeController(RuntimeConfig config, std::shared_ptr<ICompiler> compiler,
                      std::shared_ptr<SpanSink> sink = nullptr);
    // Uses the given backend instead of building one; availability still
    // follows the config, and a null backend means nothing is available.
    RuntimeController(RuntimeConfig config, std::shared_ptr<ICompiler> compiler,
                      std::shared_ptr<IBackend> backend, std::shared_ptr<SpanSink> sink = nullptr);

    // Never throws. timeout_ms == 0 selects the configured default.
    ExecutionOutcome execute(const std::string& code, Language language, const json& input, uint32_t timeout_ms = 0);
    ExecutionOutcome execute(const ExecutionRequest& request);

    bool health_check();

    const Availability& availability() const { return availability_; }
    const RuntimeConfig& config() const { return config_; }

private:
    ExecutionOutcome run_phases(const ExecutionRequest& request, uint32_t timeout_ms, Span& span);
    ExecutionOutcome dispatch_with_timeout(CompiledArtifact artifact, const json& input, uint32_t timeout_ms, Span& span);

    const RuntimeConfig config_;
    Availability availability_;
    std::shared_ptr<ICompiler> compiler_;
    std::shared_ptr<IBackend> backend_;
    Tracer tracer_;
};
