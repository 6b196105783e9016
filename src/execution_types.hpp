#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Language { javascript, typescript, python, rust, go };

std::string to_string(Language lang);
// Accepts canonical names and the usual short forms (js, ts, py, rs, golang).
std::optional<Language> parse_language(const std::string& name);

namespace error_code {
inline constexpr const char* not_available = "NOT_AVAILABLE";
inline constexpr const char* misconfigured = "MISCONFIGURED";
inline constexpr const char* compilation_error = "COMPILATION_ERROR";
inline constexpr const char* execution_error = "EXECUTION_ERROR";
inline constexpr const char* timeout = "TIMEOUT";
}

struct ExecutionRequest {
    std::string code;
    Language language = Language::javascript;
    nlohmann::json input = nlohmann::json::object();
    uint32_t timeout_ms = 0; // 0 selects the configured default
};

struct CompiledArtifact {
    std::vector<uint8_t> bytes;
    uint64_t size_bytes = 0;
    uint32_t compile_time_ms = 0;
};

struct ExecutionLimits {
    uint64_t memory_limit_bytes = 0;
    uint32_t timeout_ms = 0;
    std::string function_name = "main";
};

// What a backend reports for one dispatch. `code` is only meaningful when !ok.
struct DispatchResult {
    bool ok{false};
    nlohmann::json output;
    std::string error;
    std::string code = error_code::execution_error;
    nlohmann::json details = nlohmann::json::object();
    double ms{0.0};
    std::optional<uint64_t> memory_used_bytes;
};

struct ExecutionError {
    std::string message;
    std::string code;
    nlohmann::json details = nlohmann::json::object();
};

struct ExecutionMetadata {
    uint64_t execution_time_ms = 0;
    std::optional<uint64_t> memory_used_bytes;
};

// Normalized result of one execute() call. success == !error.has_value().
struct ExecutionOutcome {
    bool success{false};
    nlohmann::json output;
    std::optional<ExecutionError> error;
    ExecutionMetadata metadata;

    static ExecutionOutcome ok(nlohmann::json output);
    static ExecutionOutcome failure(std::string code, std::string message,
                                    nlohmann::json details = nlohmann::json::object());

    const std::string& code() const;
};

void to_json(nlohmann::json& j, const ExecutionOutcome& o);
