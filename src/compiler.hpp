#pragma once
#include "execution_types.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

class CompilationError : public std::runtime_error {
public:
    CompilationError(Language lang, const std::string& message)
        : std::runtime_error(message), language_(lang) {}
    Language language() const { return language_; }

private:
    Language language_;
};

// Source-to-WASM translation. Implementations throw CompilationError (or any
// std::exception) when the code cannot be compiled.
class ICompiler {
public:
    virtual ~ICompiler() = default;
    virtual CompiledArtifact compile(const std::string& code, Language lang) = 0;
};

bool has_wasm_magic(const std::vector<uint8_t>& bytes);

// Runs `<compiler> --language <lang>` with the source on stdin and reads the
// module from stdout.
class ExternalCompiler : public ICompiler {
public:
    ExternalCompiler(std::string compiler_path, std::chrono::milliseconds timeout);

    CompiledArtifact compile(const std::string& code, Language lang) override;

private:
    std::string compiler_path_;
    std::chrono::milliseconds timeout_;
};

// For code that already is a WASM module (binary bytes in `code`).
class WasmPassthroughCompiler : public ICompiler {
public:
    CompiledArtifact compile(const std::string& code, Language lang) override;
};
