#include "compiler.hpp"
#include "subprocess.hpp"
#include <iostream>

static uint32_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

static std::string trimmed(std::string s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool has_wasm_magic(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 8 && bytes[0] == 0x00 && bytes[1] == 'a' && bytes[2] == 's' && bytes[3] == 'm';
}

ExternalCompiler::ExternalCompiler(std::string compiler_path, std::chrono::milliseconds timeout)
    : compiler_path_(std::move(compiler_path)), timeout_(timeout) {}

CompiledArtifact ExternalCompiler::compile(const std::string& code, Language lang) {
    if (compiler_path_.empty()) {
        throw CompilationError(lang, "no compiler configured (set WASMBOX_COMPILER)");
    }
    auto t0 = std::chrono::steady_clock::now();

    SubprocessOptions opts;
    opts.argv = {compiler_path_, "--language", to_string(lang)};
    opts.stdin_data = code;
    opts.timeout = timeout_;

    std::cout << "[compiler] Compiling " << code.size() << " bytes of " << to_string(lang) << std::endl;
    auto res = run_subprocess(opts);

    if (!res.ok()) {
        std::string detail = trimmed(res.err);
        std::string message = res.describe();
        if (!detail.empty()) message += ": " + detail;
        throw CompilationError(lang, message);
    }

    CompiledArtifact a;
    a.bytes.assign(res.out.begin(), res.out.end());
    if (!has_wasm_magic(a.bytes)) {
        throw CompilationError(lang, "compiler output is not a WebAssembly module");
    }
    a.size_bytes = a.bytes.size();
    a.compile_time_ms = elapsed_ms(t0);
    std::cout << "[compiler] Produced " << a.size_bytes << " bytes in " << a.compile_time_ms << "ms" << std::endl;
    return a;
}

CompiledArtifact WasmPassthroughCompiler::compile(const std::string& code, Language lang) {
    auto t0 = std::chrono::steady_clock::now();
    CompiledArtifact a;
    a.bytes.assign(code.begin(), code.end());
    if (!has_wasm_magic(a.bytes)) {
        throw CompilationError(lang, "input is not a WebAssembly module");
    }
    a.size_bytes = a.bytes.size();
    a.compile_time_ms = elapsed_ms(t0);
    return a;
}
