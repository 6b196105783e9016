#include "artifact_manager.hpp"
#include <openssl/rand.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

// --------------------- TempArtifactHandle ---------------------

TempArtifactHandle::TempArtifactHandle(ArtifactManager& owner, std::string id,
                                       std::string wasm_path, std::string input_path)
    : owner_(&owner), id_(std::move(id)), wasm_path_(std::move(wasm_path)), input_path_(std::move(input_path)) {}

TempArtifactHandle::TempArtifactHandle(TempArtifactHandle&& other) noexcept
    : owner_(other.owner_), id_(std::move(other.id_)),
      wasm_path_(std::move(other.wasm_path_)), input_path_(std::move(other.input_path_)) {
    other.owner_ = nullptr;
}

TempArtifactHandle::~TempArtifactHandle() { release(); }

void TempArtifactHandle::release() noexcept {
    if (!owner_) return;
    ArtifactManager* owner = owner_;
    owner_ = nullptr;
    owner->cleanup({wasm_path_, input_path_});
}

// --------------------- ArtifactManager ---------------------

ArtifactManager::ArtifactManager(std::string temp_dir) : dir_(std::move(temp_dir)) {}

std::string ArtifactManager::generate_id() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        // No entropy from OpenSSL: fall back to pid + clock + counter, still unique per process.
        static std::atomic<uint64_t> counter{0};
        uint64_t a = static_cast<uint64_t>(::getpid()) << 32 | (counter.fetch_add(1) & 0xffffffffu);
        uint64_t b = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        for (int i = 0; i < 8; ++i) {
            raw[i] = static_cast<unsigned char>(a >> (i * 8));
            raw[8 + i] = static_cast<unsigned char>(b >> (i * 8));
        }
    }
    std::ostringstream ss;
    for (unsigned char c : raw) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

void ArtifactManager::ensure_directory() {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("cannot create temp directory " + dir_ + ": " + ec.message());
}

std::string ArtifactManager::path_for(const std::string& id, const char* extension) const {
    return (fs::path(dir_) / (id + extension)).string();
}

std::string ArtifactManager::write_artifact(const std::vector<uint8_t>& bytes, const std::string& id) {
    ensure_directory();
    std::string path = path_for(id.empty() ? generate_id() : id, ".wasm");

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        cleanup({path});
        throw std::runtime_error("failed to write wasm artifact " + path);
    }
    return path;
}

std::string ArtifactManager::write_input(const nlohmann::json& value, const std::string& id) {
    ensure_directory();
    // dump() throws on invalid UTF-8, so serialize before the file exists.
    std::string text = value.dump();
    std::string path = path_for(id.empty() ? generate_id() : id, ".json");

    std::ofstream file(path, std::ios::trunc);
    file << text;
    file.close();
    if (!file) {
        cleanup({path});
        throw std::runtime_error("failed to write input file " + path);
    }
    return path;
}

TempArtifactHandle ArtifactManager::materialize(const CompiledArtifact& artifact, const nlohmann::json& input) {
    std::string id = generate_id();
    std::string wasm_path = write_artifact(artifact.bytes, id);
    std::string input_path;
    try {
        input_path = write_input(input, id);
    } catch (const std::exception&) {
        cleanup({wasm_path});
        throw;
    }
    return TempArtifactHandle(*this, std::move(id), std::move(wasm_path), std::move(input_path));
}

void ArtifactManager::cleanup(const std::vector<std::string>& paths) noexcept {
    for (const auto& p : paths) {
        if (p.empty()) continue;
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            std::cerr << "[artifacts] Failed to remove " << p << ": " << ec.message() << std::endl;
        }
    }
}
