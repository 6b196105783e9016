#pragma once
#include "ibackend.hpp"
#include "../service_url.hpp"
#include <chrono>
#include <string>

// Client for the HTTP sandbox service:
//   POST <base>/execute  {"wasm","input","function_name","memory_limit","timeout"}
//   GET  <base>/health
// Every call uses its own io_context, so the backend keeps no state between calls.
class RemoteBackend : public IBackend {
public:
    RemoteBackend(ServiceUrl url, std::string api_key,
                  std::chrono::milliseconds health_timeout = std::chrono::milliseconds(5000),
                  bool insecure = false);

    std::string name() const override { return "remote"; }
    DispatchResult dispatch(const CompiledArtifact& artifact, const json& input,
                            const ExecutionLimits& limits, CancellationToken& cancel) override;
    bool health_check() override;

    static json build_request_body(const CompiledArtifact& artifact, const json& input, const ExecutionLimits& limits);

private:
    ServiceUrl url_;
    std::string api_key_;
    std::chrono::milliseconds health_timeout_;
    bool insecure_;
};
