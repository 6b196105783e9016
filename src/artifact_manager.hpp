#pragma once
#include "execution_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class ArtifactManager;

// On-disk WASM module and JSON input of one local execution. Deletes both
// files exactly once, when the handle is destroyed or release() is called.
class TempArtifactHandle {
public:
    TempArtifactHandle(ArtifactManager& owner, std::string id, std::string wasm_path, std::string input_path);
    ~TempArtifactHandle();

    TempArtifactHandle(TempArtifactHandle&& other) noexcept;
    TempArtifactHandle& operator=(TempArtifactHandle&&) = delete;
    TempArtifactHandle(const TempArtifactHandle&) = delete;
    TempArtifactHandle& operator=(const TempArtifactHandle&) = delete;

    const std::string& id() const { return id_; }
    const std::string& wasm_path() const { return wasm_path_; }
    const std::string& input_path() const { return input_path_; }

    void release() noexcept;

private:
    ArtifactManager* owner_;
    std::string id_;
    std::string wasm_path_;
    std::string input_path_;
};

class ArtifactManager {
public:
    explicit ArtifactManager(std::string temp_dir);

    const std::string& directory() const { return dir_; }

    // Both throw std::runtime_error when the file cannot be written.
    std::string write_artifact(const std::vector<uint8_t>& bytes, const std::string& id = "");
    std::string write_input(const nlohmann::json& value, const std::string& id = "");

    // Writes both files under one fresh id. Nothing is left behind on failure.
    TempArtifactHandle materialize(const CompiledArtifact& artifact, const nlohmann::json& input);

    // Best effort: never throws, failures are only logged, so a cleanup
    // problem cannot mask the execution result.
    void cleanup(const std::vector<std::string>& paths) noexcept;

    static std::string generate_id();

private:
    std::string path_for(const std::string& id, const char* extension) const;
    void ensure_directory();

    std::string dir_;
};
