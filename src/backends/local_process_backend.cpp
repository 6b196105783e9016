#include "local_process_backend.hpp"
#include "../subprocess.hpp"
#include <iostream>

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

LocalProcessBackend::LocalProcessBackend(std::string runtime_path, std::string temp_dir)
    : runtime_path_(std::move(runtime_path)), artifacts_(std::move(temp_dir)) {
    std::cout << "[local] Runtime: " << runtime_path_ << ", artifact directory: " << artifacts_.directory() << std::endl;
}

IBackend::json LocalProcessBackend::parse_output(const std::string& stdout_text, const json& input) {
    std::string out = trim(stdout_text);
    if (out.empty()) return input;
    json parsed = json::parse(out, nullptr, /*allow_exceptions*/false);
    if (parsed.is_discarded()) return out;
    return parsed;
}

DispatchResult LocalProcessBackend::dispatch(const CompiledArtifact& artifact, const json& input,
                                             const ExecutionLimits& limits, CancellationToken& cancel) {
    DispatchResult r;
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    };

    try {
        // Removes both files when this scope is left, whichever way.
        TempArtifactHandle files = artifacts_.materialize(artifact, input);

        SubprocessOptions opts;
        opts.argv = {runtime_path_, files.wasm_path()};
        opts.stdin_path = files.input_path();
        opts.timeout = std::chrono::milliseconds(limits.timeout_ms);
        opts.output_limit = limits.memory_limit_bytes;

        std::cout << "[local] Executing: " << runtime_path_ << " " << files.wasm_path() << std::endl;
        auto res = run_subprocess(opts, &cancel);
        r.ms = res.ms;

        if (res.ok()) {
            r.ok = true;
            r.output = parse_output(res.out, input);
            std::cout << "[local] Completed " << files.id() << " in " << res.ms << "ms" << std::endl;
            return r;
        }

        r.error = res.describe();
        r.details = {{"stdout", trim(res.out)}, {"stderr", trim(res.err)}};
        if (res.timed_out || res.cancelled) {
            r.code = error_code::timeout;
            r.error = "sandbox execution timed out after " + std::to_string(limits.timeout_ms) + "ms";
        } else {
            r.code = error_code::execution_error;
            if (res.term_signal) r.details["signal"] = res.term_signal;
            else if (res.started) r.details["exitCode"] = res.exit_code;
        }
        std::cerr << "[local] " << files.id() << ": " << r.error << std::endl;
    } catch (const std::exception& e) {
        r.ok = false;
        r.code = error_code::execution_error;
        r.error = e.what();
        r.ms = elapsed();
        std::cerr << "[local] Execution failed: " << e.what() << std::endl;
    }
    return r;
}

bool LocalProcessBackend::health_check() {
    return executable_available(runtime_path_);
}
