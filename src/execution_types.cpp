#include "execution_types.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

std::string to_string(Language lang) {
    switch (lang) {
    case Language::javascript: return "javascript";
    case Language::typescript: return "typescript";
    case Language::python: return "python";
    case Language::rust: return "rust";
    case Language::go: return "go";
    }
    return "unknown";
}

std::optional<Language> parse_language(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

    if (s == "javascript" || s == "js") return Language::javascript;
    if (s == "typescript" || s == "ts") return Language::typescript;
    if (s == "python" || s == "py") return Language::python;
    if (s == "rust" || s == "rs") return Language::rust;
    if (s == "go" || s == "golang") return Language::go;
    return std::nullopt;
}

ExecutionOutcome ExecutionOutcome::ok(json output) {
    ExecutionOutcome o;
    o.success = true;
    o.output = std::move(output);
    return o;
}

ExecutionOutcome ExecutionOutcome::failure(std::string code, std::string message, json details) {
    ExecutionOutcome o;
    o.success = false;
    o.error = ExecutionError{std::move(message), std::move(code), std::move(details)};
    return o;
}

const std::string& ExecutionOutcome::code() const {
    static const std::string none;
    return error ? error->code : none;
}

void to_json(json& j, const ExecutionOutcome& o) {
    j = json{{"success", o.success}};
    if (o.success) {
        j["output"] = o.output;
    }
    if (o.error) {
        j["error"] = {
            {"message", o.error->message},
            {"code", o.error->code},
            {"details", o.error->details}
        };
    }
    json meta = {{"executionTimeMs", o.metadata.execution_time_ms}};
    if (o.metadata.memory_used_bytes) meta["memoryUsedBytes"] = *o.metadata.memory_used_bytes;
    j["metadata"] = meta;
}
