#include <gtest/gtest.h>
#include "compiler.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;

class ExternalCompilerTest : public ::testing::Test {
protected:
    ScratchDir scratch;

    ExternalCompiler compiler_with(const std::string& body, std::chrono::milliseconds timeout = 5000ms) {
        return ExternalCompiler(write_script(scratch.sub("compile.sh"), body), timeout);
    }
};

TEST_F(ExternalCompilerTest, ReadsModuleFromStdout) {
    // Checks the language flag and that the source arrives on stdin.
    auto compiler = compiler_with(
        "[ \"$1\" = --language ] && [ \"$2\" = python ] || exit 5\n"
        "grep -q 'print' || exit 6\n"
        "printf '\\000asm\\001\\000\\000\\000'");
    auto a = compiler.compile("print(1)", Language::python);
    EXPECT_EQ(a.bytes, minimal_wasm());
    EXPECT_EQ(a.size_bytes, 8u);
}

TEST_F(ExternalCompilerTest, FailureCarriesCompilerMessage) {
    auto compiler = compiler_with("echo 'SyntaxError: invalid syntax' >&2\nexit 1");
    try {
        compiler.compile("def (", Language::python);
        FAIL() << "expected CompilationError";
    } catch (const CompilationError& e) {
        EXPECT_EQ(e.language(), Language::python);
        EXPECT_STREQ(e.what(), "process exited with code 1: SyntaxError: invalid syntax");
    }
}

TEST_F(ExternalCompilerTest, RejectsNonWasmOutput) {
    auto compiler = compiler_with("echo 'not a module'");
    EXPECT_THROW(compiler.compile("x", Language::go), CompilationError);
}

TEST_F(ExternalCompilerTest, TimesOut) {
    auto compiler = compiler_with("sleep 10", 200ms);
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(compiler.compile("x", Language::rust), CompilationError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 3s);
}

TEST(ExternalCompiler, MissingPathThrows) {
    ExternalCompiler compiler("", 1000ms);
    EXPECT_THROW(compiler.compile("x", Language::javascript), CompilationError);
}

TEST(WasmPassthroughCompiler, AcceptsModulesOnly) {
    WasmPassthroughCompiler compiler;
    auto wasm = minimal_wasm();
    auto a = compiler.compile(std::string(wasm.begin(), wasm.end()), Language::rust);
    EXPECT_EQ(a.bytes, wasm);
    EXPECT_EQ(a.size_bytes, 8u);

    EXPECT_THROW(compiler.compile("fn main() {}", Language::rust), CompilationError);
    EXPECT_FALSE(has_wasm_magic({0x00, 0x61, 0x73}));
}
