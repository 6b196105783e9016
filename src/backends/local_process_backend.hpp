#pragma once
#include "ibackend.hpp"
#include "../artifact_manager.hpp"
#include <string>

// Runs the module with a local sandbox runtime binary (wasmedge by default):
// `<runtime> <module.wasm>` with the JSON input on stdin.
class LocalProcessBackend : public IBackend {
public:
    LocalProcessBackend(std::string runtime_path, std::string temp_dir);

    std::string name() const override { return "local"; }
    DispatchResult dispatch(const CompiledArtifact& artifact, const json& input,
                            const ExecutionLimits& limits, CancellationToken& cancel) override;
    bool health_check() override;

    const ArtifactManager& artifacts() const { return artifacts_; }

    // Empty stdout echoes the input, JSON is parsed, anything else is kept verbatim.
    static json parse_output(const std::string& stdout_text, const json& input);

private:
    std::string runtime_path_;
    ArtifactManager artifacts_;
};
