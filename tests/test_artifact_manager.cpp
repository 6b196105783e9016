#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include "artifact_manager.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

TEST(ArtifactManager, GeneratesDistinctIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(ArtifactManager::generate_id());
    EXPECT_EQ(ids.size(), 1000u);
    EXPECT_EQ(ids.begin()->size(), 32u);
}

TEST(ArtifactManager, MaterializesBothFilesUnderOneId) {
    ScratchDir dir;
    ArtifactManager mgr(dir.sub("artifacts"));

    std::string wasm_path, input_path;
    {
        auto handle = mgr.materialize(minimal_artifact(), {{"x", 1}});
        wasm_path = handle.wasm_path();
        input_path = handle.input_path();

        EXPECT_TRUE(fs::exists(wasm_path));
        EXPECT_TRUE(fs::exists(input_path));
        EXPECT_EQ(fs::path(wasm_path).stem(), fs::path(input_path).stem());
        EXPECT_EQ(fs::path(wasm_path).extension(), ".wasm");
        EXPECT_EQ(fs::file_size(wasm_path), 8u);

        std::ifstream in(input_path);
        auto parsed = nlohmann::json::parse(in);
        EXPECT_EQ(parsed["x"], 1);
    }
    EXPECT_FALSE(fs::exists(wasm_path));
    EXPECT_FALSE(fs::exists(input_path));
}

TEST(ArtifactManager, UnserializableInputLeavesNothingBehind) {
    ScratchDir dir;
    ArtifactManager mgr(dir.str());
    nlohmann::json bad = {{"name", "\xff"}};
    EXPECT_THROW(mgr.write_input(bad), nlohmann::json::type_error);
    EXPECT_THROW(mgr.materialize(minimal_artifact(), bad), nlohmann::json::type_error);
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST(ArtifactManager, ReleaseDeletesOnlyOnce) {
    ScratchDir dir;
    ArtifactManager mgr(dir.str());
    auto handle = mgr.materialize(minimal_artifact(), nullptr);
    handle.release();
    EXPECT_EQ(dir.file_count(), 0u);

    // A file reusing the name after release must survive the handle's destructor.
    std::ofstream(handle.wasm_path()) << "reused";
    handle.release();
    EXPECT_TRUE(fs::exists(handle.wasm_path()));
}

TEST(ArtifactManager, MovedHandleCleansUpOnce) {
    ScratchDir dir;
    ArtifactManager mgr(dir.str());
    {
        auto first = mgr.materialize(minimal_artifact(), nullptr);
        TempArtifactHandle second(std::move(first));
        EXPECT_EQ(dir.file_count(), 2u);
    }
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST(ArtifactManager, CleanupOfMissingFilesDoesNotThrow) {
    ScratchDir dir;
    ArtifactManager mgr(dir.str());
    EXPECT_NO_THROW(mgr.cleanup({dir.sub("nope.wasm"), "", dir.sub("nope.json")}));
}

TEST(ArtifactManager, ConcurrentRequestsNeverShareFiles) {
    ScratchDir dir;
    ArtifactManager mgr(dir.str());
    std::vector<TempArtifactHandle> handles;
    for (int i = 0; i < 50; ++i) handles.push_back(mgr.materialize(minimal_artifact(), i));
    EXPECT_EQ(dir.file_count(), 100u);
    handles.clear();
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST(ArtifactManager, WriteFailsWhenDirectoryCannotBeCreated) {
    ScratchDir dir;
    std::string blocker = dir.sub("file");
    std::ofstream(blocker) << "x";
    ArtifactManager mgr(blocker + "/sub");
    EXPECT_THROW(mgr.write_artifact(minimal_wasm()), std::runtime_error);
}
