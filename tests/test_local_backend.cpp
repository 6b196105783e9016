#include <gtest/gtest.h>
#include "backends/local_process_backend.hpp"
#include "test_util.hpp"

using json = nlohmann::json;

namespace {

ExecutionLimits limits(uint32_t timeout_ms, uint64_t memory = 1 << 20) {
    ExecutionLimits l;
    l.timeout_ms = timeout_ms;
    l.memory_limit_bytes = memory;
    return l;
}

class LocalBackendTest : public ::testing::Test {
protected:
    ScratchDir scratch;
    ScratchDir artifacts;

    LocalProcessBackend backend_with(const std::string& script_body) {
        return LocalProcessBackend(write_script(scratch.sub("runtime.sh"), script_body), artifacts.str());
    }
};

} // namespace

TEST_F(LocalBackendTest, ParsesJsonStdout) {
    auto backend = backend_with("echo '{\"output\":2}'");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.output, json({{"output", 2}}));
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, PassesModulePathAndInputOnStdin) {
    // Prints the input it received and whether the module file exists.
    auto backend = backend_with("test -f \"$1\" || exit 9\ncat");
    CancellationToken token;
    json input = {{"name", "wasm"}, {"n", 3}};
    auto r = backend.dispatch(minimal_artifact(), input, limits(5000), token);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.output, input);
}

TEST_F(LocalBackendTest, RawTextIsKeptVerbatim) {
    auto backend = backend_with("printf '  hello world \\n'");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.output, "hello world");
}

TEST_F(LocalBackendTest, EmptyStdoutEchoesInput) {
    auto backend = backend_with("true");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json{{"k", "v"}}, limits(5000), token);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.output, json({{"k", "v"}}));
}

TEST_F(LocalBackendTest, NonZeroExitIsExecutionError) {
    auto backend = backend_with("echo partial; echo 'trap: unreachable' >&2; exit 1");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::execution_error);
    EXPECT_EQ(r.details["stderr"], "trap: unreachable");
    EXPECT_EQ(r.details["stdout"], "partial");
    EXPECT_EQ(r.details["exitCode"], 1);
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, TimeoutIsReportedAndFilesRemoved) {
    auto backend = backend_with("sleep 10");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(100), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::timeout);
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, ExitCodeAloneIsNotATimeout) {
    // 124 is what timeout(1) uses; it must still be an ordinary failure.
    auto backend = backend_with("exit 124");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    EXPECT_EQ(r.code, error_code::execution_error);
}

TEST_F(LocalBackendTest, OutputCapActsAsMemoryBound) {
    auto backend = backend_with("yes");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000, 4096), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::execution_error);
    EXPECT_EQ(r.error, "output limit exceeded");
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, MissingRuntimeIsExecutionError) {
    LocalProcessBackend backend("/nonexistent/wasmedge", artifacts.str());
    EXPECT_FALSE(backend.health_check());
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::execution_error);
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, UnwritableArtifactDirectoryIsExecutionError) {
    std::string blocker = scratch.sub("blocker");
    std::ofstream(blocker) << "x";
    LocalProcessBackend backend(write_script(scratch.sub("rt.sh"), "true"), blocker + "/artifacts");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json::object(), limits(5000), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::execution_error);
}

TEST_F(LocalBackendTest, InvalidUtf8InputLeavesNoFiles) {
    auto backend = backend_with("cat");
    CancellationToken token;
    auto r = backend.dispatch(minimal_artifact(), json{{"name", "\xff\xfe bad utf8"}}, limits(5000), token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, error_code::execution_error);
    EXPECT_EQ(artifacts.file_count(), 0u);
}

TEST_F(LocalBackendTest, HealthCheckFindsRuntime) {
    auto backend = backend_with("true");
    EXPECT_TRUE(backend.health_check());
}

TEST(LocalBackendOutput, ParsesJsonScalarsAndArrays) {
    EXPECT_EQ(LocalProcessBackend::parse_output("[1,2]\n", nullptr), json::array({1, 2}));
    EXPECT_EQ(LocalProcessBackend::parse_output("42", nullptr), 42);
    EXPECT_EQ(LocalProcessBackend::parse_output("{broken", nullptr), "{broken");
}
