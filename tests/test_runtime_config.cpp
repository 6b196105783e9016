#include <gtest/gtest.h>
#include <cstdlib>
#include "execution_types.hpp"
#include "runtime_config.hpp"

namespace {

const char* const kVars[] = {
    "WASMBOX_BACKEND", "WASMEDGE_SERVICE_URL", "WASMEDGE_API_KEY", "WASMEDGE_ENABLED",
    "WASMEDGE_PATH", "WASMBOX_DEFAULT_TIMEOUT_MS", "WASMBOX_MAX_TIMEOUT_MS",
    "WASMBOX_MEMORY_LIMIT", "WASMBOX_TEMP_DIR", "WASMBOX_FUNCTION", "WASMBOX_COMPILER",
    "WASMBOX_TLS_INSECURE",
};

class RuntimeConfigEnv : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : kVars) ::unsetenv(v);
    }
    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

} // namespace

TEST_F(RuntimeConfigEnv, DefaultsWithEmptyEnvironment) {
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.backend, BackendKind::none);
    EXPECT_EQ(c.default_timeout_ms, 5000u);
    EXPECT_EQ(c.max_timeout_ms, 30000u);
    EXPECT_EQ(c.memory_limit_bytes, 128ull * 1024 * 1024);
    EXPECT_EQ(c.local_runtime_path, "wasmedge");
    EXPECT_EQ(c.function_name, "main");
    EXPECT_FALSE(c.tls_insecure);

    auto a = c.availability();
    EXPECT_EQ(a.state, Availability::State::not_available);
    EXPECT_FALSE(a.reason.empty());
}

TEST_F(RuntimeConfigEnv, ServiceUrlSelectsRemote) {
    set("WASMEDGE_SERVICE_URL", "http://sandbox:8080");
    set("WASMEDGE_API_KEY", "k");
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.backend, BackendKind::remote);
    EXPECT_EQ(c.service_url, "http://sandbox:8080");
    EXPECT_EQ(c.api_key, "k");
    EXPECT_TRUE(c.availability().available());
}

TEST_F(RuntimeConfigEnv, EnabledFlagSelectsLocal) {
    set("WASMEDGE_ENABLED", "TRUE");
    set("WASMEDGE_PATH", "/opt/wasmedge/bin/wasmedge");
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.backend, BackendKind::local);
    EXPECT_EQ(c.local_runtime_path, "/opt/wasmedge/bin/wasmedge");
    EXPECT_TRUE(c.availability().available());

    set("WASMEDGE_ENABLED", "yes");
    EXPECT_EQ(RuntimeConfig::from_env().backend, BackendKind::none);
}

TEST_F(RuntimeConfigEnv, ExplicitBackendWins) {
    set("WASMEDGE_SERVICE_URL", "http://sandbox:8080");
    set("WASMBOX_BACKEND", "local");
    EXPECT_EQ(RuntimeConfig::from_env().backend, BackendKind::local);

    set("WASMBOX_BACKEND", "none");
    EXPECT_EQ(RuntimeConfig::from_env().backend, BackendKind::none);

    set("WASMBOX_BACKEND", "bogus");
    EXPECT_EQ(RuntimeConfig::from_env().backend, BackendKind::remote);
}

TEST_F(RuntimeConfigEnv, RemoteWithoutUsableUrlIsMisconfigured) {
    set("WASMBOX_BACKEND", "remote");
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.availability().state, Availability::State::misconfigured);

    set("WASMEDGE_SERVICE_URL", "sandbox:8080");
    c = RuntimeConfig::from_env();
    auto a = c.availability();
    EXPECT_EQ(a.state, Availability::State::misconfigured);
    EXPECT_NE(a.reason.find("sandbox:8080"), std::string::npos);
}

TEST_F(RuntimeConfigEnv, NumericOverridesAndInvalidValues) {
    set("WASMBOX_DEFAULT_TIMEOUT_MS", "1500");
    set("WASMBOX_MAX_TIMEOUT_MS", "abc");
    set("WASMBOX_MEMORY_LIMIT", "1048576");
    set("WASMBOX_FUNCTION", "run");
    set("WASMBOX_TLS_INSECURE", "true");
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.default_timeout_ms, 1500u);
    EXPECT_EQ(c.max_timeout_ms, 30000u);
    EXPECT_EQ(c.memory_limit_bytes, 1048576u);
    EXPECT_EQ(c.function_name, "run");
    EXPECT_TRUE(c.tls_insecure);

    set("WASMBOX_DEFAULT_TIMEOUT_MS", "99999999999");
    EXPECT_EQ(RuntimeConfig::from_env().default_timeout_ms, 5000u);
}

TEST(RuntimeConfig, EffectiveTimeoutDefaultsAndClamps) {
    RuntimeConfig c;
    c.default_timeout_ms = 5000;
    c.max_timeout_ms = 30000;
    EXPECT_EQ(c.effective_timeout(0), 5000u);
    EXPECT_EQ(c.effective_timeout(100), 100u);
    EXPECT_EQ(c.effective_timeout(30000), 30000u);
    EXPECT_EQ(c.effective_timeout(60000), 30000u);

    c.default_timeout_ms = 50000;
    EXPECT_EQ(c.effective_timeout(0), 30000u);
}

TEST(RuntimeConfig, ZeroMaxTimeoutIsMisconfigured) {
    RuntimeConfig c;
    c.backend = BackendKind::local;
    c.max_timeout_ms = 0;
    EXPECT_EQ(c.availability().state, Availability::State::misconfigured);
}

TEST_F(RuntimeConfigEnv, ZeroDefaultTimeoutIsMisconfigured) {
    set("WASMBOX_BACKEND", "local");
    set("WASMBOX_DEFAULT_TIMEOUT_MS", "0");
    auto c = RuntimeConfig::from_env();
    EXPECT_EQ(c.default_timeout_ms, 0u);
    auto a = c.availability();
    EXPECT_EQ(a.state, Availability::State::misconfigured);
    EXPECT_NE(a.reason.find("default timeout"), std::string::npos);
}

TEST(RuntimeConfig, TempDirResolution) {
    RuntimeConfig c;
    c.temp_dir = "/var/tmp/custom";
    EXPECT_EQ(c.resolved_temp_dir(), "/var/tmp/custom");
    c.temp_dir.clear();
    auto dir = c.resolved_temp_dir();
    ASSERT_GE(dir.size(), 8u);
    EXPECT_EQ(dir.substr(dir.size() - 8), "/wasmbox");
}

TEST(Language, ParsesNamesAndAliases) {
    EXPECT_EQ(parse_language("javascript"), Language::javascript);
    EXPECT_EQ(parse_language("JS"), Language::javascript);
    EXPECT_EQ(parse_language("ts"), Language::typescript);
    EXPECT_EQ(parse_language("Python"), Language::python);
    EXPECT_EQ(parse_language("rs"), Language::rust);
    EXPECT_EQ(parse_language("golang"), Language::go);
    EXPECT_FALSE(parse_language("cobol").has_value());
    EXPECT_FALSE(parse_language("").has_value());

    for (auto lang : {Language::javascript, Language::typescript, Language::python, Language::rust, Language::go}) {
        EXPECT_EQ(parse_language(to_string(lang)), lang);
    }
}
