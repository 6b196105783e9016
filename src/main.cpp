#include <iostream>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "runtime_controller.hpp"

// Very small CLI parser
struct Args {
    std::string language = "javascript";
    std::string source = "-";           // file path or "-" for stdin
    nlohmann::json input = nlohmann::json::object();
    uint32_t timeout_ms = 0;
    bool wasm = false;                  // source already is a WASM module
    bool health = false;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--language L] [--input JSON | --input-file F] [--timeout MS] [--wasm] [--health] <source|->\n";
    std::cout << "\nLanguages: javascript, typescript, python, rust, go\n";
    std::cout << "\nThe backend is selected from the environment:\n"
              << "  WASMBOX_BACKEND=remote|local|none, WASMEDGE_SERVICE_URL, WASMEDGE_API_KEY,\n"
              << "  WASMEDGE_ENABLED=true, WASMEDGE_PATH, WASMBOX_COMPILER, WASMBOX_DEFAULT_TIMEOUT_MS,\n"
              << "  WASMBOX_MAX_TIMEOUT_MS, WASMBOX_MEMORY_LIMIT, WASMBOX_TEMP_DIR, WASMBOX_FUNCTION\n";
}

static std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

[[noreturn]] static void usage_error(const char* argv0, const std::string& msg) {
    std::cerr << msg << "\n";
    print_help(argv0);
    std::exit(2);
}

static Args parse_args(int argc, char** argv) {
    Args a;
    bool have_source = false;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--language" && i + 1 < argc) { a.language = argv[++i]; }
        else if (s == "--input" && i + 1 < argc) {
            a.input = nlohmann::json::parse(argv[++i], nullptr, false);
            if (a.input.is_discarded()) usage_error(argv[0], "--input is not valid JSON");
        }
        else if (s == "--input-file" && i + 1 < argc) {
            std::ifstream f(argv[++i]);
            if (!f) usage_error(argv[0], std::string("cannot open ") + argv[i]);
            a.input = nlohmann::json::parse(f, nullptr, false);
            if (a.input.is_discarded()) usage_error(argv[0], std::string(argv[i]) + " is not valid JSON");
        }
        else if (s == "--timeout" && i + 1 < argc) {
            long v = std::atol(argv[++i]);
            if (v <= 0) usage_error(argv[0], "--timeout must be a positive number of milliseconds");
            a.timeout_ms = static_cast<uint32_t>(v);
        }
        else if (s == "--wasm") { a.wasm = true; }
        else if (s == "--health") { a.health = true; }
        else if (!have_source && (s == "-" || s.rfind("--", 0) != 0)) { a.source = s; have_source = true; }
        else { usage_error(argv[0], "Unknown arg: " + s); }
    }
    if (!a.health && !have_source) usage_error(argv[0], "missing source file");
    return a;
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    auto config = RuntimeConfig::from_env();
    std::shared_ptr<ICompiler> compiler;
    if (args.wasm) {
        compiler = std::make_shared<WasmPassthroughCompiler>();
    } else {
        compiler = std::make_shared<ExternalCompiler>(config.compiler_path,
                                                      std::chrono::milliseconds(config.max_timeout_ms));
    }
    RuntimeController runtime{config, compiler};

    if (args.health) {
        bool healthy = runtime.health_check();
        std::cout << nlohmann::json{{"healthy", healthy}, {"backend", to_string(config.backend)}}.dump() << std::endl;
        return healthy ? 0 : 1;
    }

    auto language = parse_language(args.language);
    if (!language) usage_error(argv[0], "Unsupported language: " + args.language);

    std::string code;
    if (args.source == "-") {
        code = read_all(std::cin);
    } else {
        std::ifstream f(args.source, std::ios::binary);
        if (!f) usage_error(argv[0], "cannot open " + args.source);
        code = read_all(f);
    }

    auto outcome = runtime.execute(code, *language, args.input, args.timeout_ms);
    std::cout << nlohmann::json(outcome).dump(2) << std::endl;
    return outcome.success ? 0 : 1;
}
