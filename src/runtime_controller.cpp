#include "runtime_controller.hpp"
#include <openssl/sha.h>
#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

// --------------------- helpers ---------------------

static std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(hash, &ctx);
    std::ostringstream ss;
    for (unsigned char c : hash) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

static uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

// --------------------- ctor ---------------------

RuntimeController::RuntimeController(RuntimeConfig config, std::shared_ptr<ICompiler> compiler,
                                     std::shared_ptr<SpanSink> sink)
    : config_(std::move(config)),
      availability_(config_.availability()),
      compiler_(std::move(compiler)),
      backend_(make_backend(config_)),
      tracer_(std::move(sink)) {
    if (availability_.available() && !backend_) {
        availability_ = {Availability::State::misconfigured, "backend could not be created"};
    }
    std::cout << "[runtime] Backend: " << (backend_ ? backend_->name() : std::string("none")) << std::endl;
}

RuntimeController::RuntimeController(RuntimeConfig config, std::shared_ptr<ICompiler> compiler,
                                     std::shared_ptr<IBackend> backend, std::shared_ptr<SpanSink> sink)
    : config_(std::move(config)),
      compiler_(std::move(compiler)),
      backend_(std::move(backend)),
      tracer_(std::move(sink)) {
    availability_ = config_.availability();
    if (availability_.available() && !backend_) {
        availability_ = {Availability::State::not_available, "no sandbox backend configured"};
    }
}

// --------------------- execute ---------------------

ExecutionOutcome RuntimeController::execute(const std::string& code, Language language, const json& input,
                                            uint32_t timeout_ms) {
    ExecutionRequest req;
    req.code = code;
    req.language = language;
    req.input = input;
    req.timeout_ms = timeout_ms;
    return execute(req);
}

ExecutionOutcome RuntimeController::execute(const ExecutionRequest& request) {
    auto t0 = std::chrono::steady_clock::now();
    const uint32_t timeout_ms = config_.effective_timeout(request.timeout_ms);

    auto span = tracer_.start_span("wasmbox.execute", {
        {"wasmbox.language", to_string(request.language)},
        {"wasmbox.timeout_ms", timeout_ms},
        {"wasmbox.code_length", request.code.size()},
        {"wasmbox.backend", backend_ ? backend_->name() : std::string("none")}
    });

    ExecutionOutcome outcome;
    try {
        outcome = run_phases(request, timeout_ms, *span);
    } catch (const std::exception& e) {
        span->record_exception(e);
        outcome = ExecutionOutcome::failure(error_code::execution_error,
                                            std::string("sandbox execution failed: ") + e.what());
    } catch (...) {
        std::cerr << "[runtime] Execution failed with a non-standard exception" << std::endl;
        span->record_exception(std::runtime_error("non-standard exception"));
        outcome = ExecutionOutcome::failure(error_code::execution_error,
                                            "sandbox execution failed: unknown error");
    }

    outcome.metadata.execution_time_ms = elapsed_ms(t0);

    span->set_attributes({
        {"wasmbox.success", outcome.success},
        {"wasmbox.execution_time_ms", outcome.metadata.execution_time_ms},
        {"wasmbox.memory_used", outcome.metadata.memory_used_bytes.value_or(0)}
    });
    if (outcome.success) {
        span->set_status(SpanStatus::ok);
    } else {
        span->set_attribute("wasmbox.error_code", outcome.code());
        span->set_status(SpanStatus::error, outcome.error->message);
    }
    span->end();
    return outcome;
}

ExecutionOutcome RuntimeController::run_phases(const ExecutionRequest& request, uint32_t timeout_ms, Span& span) {
    if (!availability_.available() || !backend_) {
        bool misconfigured = availability_.state == Availability::State::misconfigured;
        std::cerr << "[runtime] Rejecting execution: " << availability_.reason << std::endl;
        return ExecutionOutcome::failure(
            misconfigured ? error_code::misconfigured : error_code::not_available,
            "WASM sandbox runtime is not available: " + availability_.reason,
            {{"reason", availability_.reason}, {"backend", to_string(config_.backend)}});
    }

    CompiledArtifact artifact;
    try {
        if (!compiler_) throw CompilationError(request.language, "no compiler configured");
        artifact = compiler_->compile(request.code, request.language);
    } catch (const std::exception& e) {
        span.record_exception(e);
        std::cerr << "[runtime] Compilation failed (" << to_string(request.language) << "): " << e.what() << std::endl;
        return ExecutionOutcome::failure(
            error_code::compilation_error,
            "Failed to compile " + to_string(request.language) + " to WASM: " + e.what(),
            {{"language", to_string(request.language)}, {"message", e.what()}});
    } catch (...) {
        span.record_exception(std::runtime_error("non-standard exception from compiler"));
        std::cerr << "[runtime] Compilation failed (" << to_string(request.language) << "): unknown error" << std::endl;
        return ExecutionOutcome::failure(
            error_code::compilation_error,
            "Failed to compile " + to_string(request.language) + " to WASM: unknown compiler error",
            {{"language", to_string(request.language)}, {"message", "unknown compiler error"}});
    }
    if (artifact.size_bytes == 0) artifact.size_bytes = artifact.bytes.size();

    span.set_attributes({
        {"wasmbox.compilation_time_ms", artifact.compile_time_ms},
        {"wasmbox.wasm_size", artifact.size_bytes},
        {"wasmbox.wasm_sha256", sha256_hex(artifact.bytes)}
    });

    return dispatch_with_timeout(std::move(artifact), request.input, timeout_ms, span);
}

ExecutionOutcome RuntimeController::dispatch_with_timeout(CompiledArtifact artifact, const json& input,
                                                          uint32_t timeout_ms, Span& span) {
    ExecutionLimits limits;
    limits.memory_limit_bytes = config_.memory_limit_bytes;
    limits.timeout_ms = timeout_ms;
    limits.function_name = config_.function_name;

    auto token = std::make_shared<CancellationToken>();
    auto backend = backend_;
    auto task = std::async(std::launch::async,
        [backend, token, limits, artifact = std::move(artifact), input]() {
            return backend->dispatch(artifact, input, limits, *token);
        });

    if (task.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        token->cancel();
        // Join the loser so its subprocess is gone and its files are deleted before returning.
        try {
            task.get();
        } catch (const std::exception& e) {
            std::cerr << "[runtime] Cancelled dispatch failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[runtime] Cancelled dispatch failed with a non-standard exception" << std::endl;
        }
        std::cerr << "[runtime] Execution timed out after " << timeout_ms << "ms" << std::endl;
        return ExecutionOutcome::failure(error_code::timeout,
                                         "WASM execution timed out after " + std::to_string(timeout_ms) + "ms",
                                         {{"timeoutMs", timeout_ms}});
    }

    DispatchResult r;
    try {
        r = task.get();
    } catch (const std::exception& e) {
        span.record_exception(e);
        return ExecutionOutcome::failure(error_code::execution_error, e.what(), {{"timeoutMs", timeout_ms}});
    }

    span.set_attribute("wasmbox.backend_execution_time_ms", r.ms);

    ExecutionOutcome outcome;
    if (r.ok) {
        outcome = ExecutionOutcome::ok(std::move(r.output));
    } else {
        json details = r.details.is_object() ? r.details : json{{"backend", r.details}};
        details["backendExecutionTimeMs"] = static_cast<uint64_t>(r.ms);
        outcome = ExecutionOutcome::failure(r.code.empty() ? error_code::execution_error : r.code,
                                            r.error.empty() ? "WASM execution failed" : r.error,
                                            std::move(details));
    }
    outcome.metadata.memory_used_bytes = r.memory_used_bytes;
    return outcome;
}

bool RuntimeController::health_check() {
    if (!backend_) return false;
    try {
        return backend_->health_check();
    } catch (const std::exception& e) {
        std::cerr << "[runtime] Health check failed: " << e.what() << std::endl;
        return false;
    } catch (...) {
        std::cerr << "[runtime] Health check failed with a non-standard exception" << std::endl;
        return false;
    }
}
