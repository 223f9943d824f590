#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <algorithm>
#include "catalog/catalog.hpp"
#include "sandbox/sandbox.hpp"
#include "playground_server.hpp"

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// Very small CLI parser
struct Args {
    std::string address = "0.0.0.0";
    unsigned short port = 3000;
    std::string katas_dir = "../katas";
    std::string static_dir = "../frontend/dist";
    int concurrency = std::max(1u, std::thread::hardware_concurrency());
    std::string compiler = "rustc";
    std::string edition = "2021";
    std::string workspace_root;
    int compile_timeout_s = 10;
    int run_timeout_s = 5;
    int max_output_kb = 1024;
    std::string tls_cert;
    std::string tls_key;
    bool verbose = true;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "\n"
              << "  --address ADDR           listen address (default 0.0.0.0)\n"
              << "  --port N                 listen port (default 3000)\n"
              << "  --katas-dir DIR          kata catalog directory (default ../katas)\n"
              << "  --static-dir DIR         frontend files, empty to disable (default ../frontend/dist)\n"
              << "  --concurrency N          worker threads (default: hardware threads)\n"
              << "  --compiler PATH          compiler executable (default rustc)\n"
              << "  --edition E              edition passed as --edition E (default 2021)\n"
              << "  --workspace-root DIR     where per-request directories go (default: temp dir)\n"
              << "  --compile-timeout SECS   compile limit (default 10)\n"
              << "  --run-timeout SECS       run limit (default 5)\n"
              << "  --max-output-kb N        captured bytes kept per stream, in KiB (default 1024)\n"
              << "  --tls-cert FILE --tls-key FILE   serve HTTPS\n"
              << "  --quiet                  no per-request logging\n";
    std::cout << "\nThe server can be stopped gracefully with Ctrl+C (SIGINT) or SIGTERM.\n";
}

[[noreturn]] static void usage_error(const char* argv0, const std::string& msg) {
    std::cerr << msg << "\n";
    print_help(argv0);
    std::exit(2);
}

static int parse_int(const char* argv0, const std::string& flag, const std::string& value, int min, int max) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size() && v >= min && v <= max) return v;
    } catch (const std::exception&) {
    }
    usage_error(argv0, "Invalid value for " + flag + ": " + value);
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) usage_error(argv[0], "Missing value for " + s);
            return argv[++i];
        };
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--address") { a.address = next(); }
        else if (s == "--port") { a.port = static_cast<unsigned short>(parse_int(argv[0], s, next(), 0, 65535)); }
        else if (s == "--katas-dir") { a.katas_dir = next(); }
        else if (s == "--static-dir") { a.static_dir = next(); }
        else if (s == "--concurrency") { a.concurrency = parse_int(argv[0], s, next(), 1, 1024); }
        else if (s == "--compiler") { a.compiler = next(); }
        else if (s == "--edition") { a.edition = next(); }
        else if (s == "--workspace-root") { a.workspace_root = next(); }
        else if (s == "--compile-timeout") { a.compile_timeout_s = parse_int(argv[0], s, next(), 1, 3600); }
        else if (s == "--run-timeout") { a.run_timeout_s = parse_int(argv[0], s, next(), 1, 3600); }
        else if (s == "--max-output-kb") { a.max_output_kb = parse_int(argv[0], s, next(), 1, 65536); }
        else if (s == "--tls-cert") { a.tls_cert = next(); }
        else if (s == "--tls-key") { a.tls_key = next(); }
        else if (s == "--quiet") { a.verbose = false; }
        else { usage_error(argv[0], "Unknown arg: " + s); }
    }
    if (a.tls_cert.empty() != a.tls_key.empty()) {
        usage_error(argv[0], "--tls-cert and --tls-key must be given together");
    }
    return a;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto args = parse_args(argc, argv);

    SandboxConfig cfg;
    cfg.compiler = args.compiler;
    cfg.edition = args.edition;
    cfg.workspace_root = args.workspace_root;
    cfg.compile_timeout = std::chrono::seconds(args.compile_timeout_s);
    cfg.run_timeout = std::chrono::seconds(args.run_timeout_s);
    cfg.max_output_bytes = static_cast<size_t>(args.max_output_kb) * 1024;
    std::string problem = cfg.validate();
    if (!problem.empty()) {
        usage_error(argv[0], "Invalid sandbox configuration: " + problem);
    }

    auto catalog = Catalog::load(args.katas_dir);
    Sandbox sandbox{cfg, args.verbose};

    ApiContext ctx;
    ctx.catalog = catalog;
    ctx.sandbox = &sandbox;
    ctx.static_dir = args.static_dir;

    PlaygroundServer server{ctx, args.concurrency, args.verbose};
    TlsOptions tls{args.tls_cert, args.tls_key};
    if (!server.start(args.address, args.port, args.tls_cert.empty() ? nullptr : &tls)) {
        std::cerr << "[main] Failed to bind to " << args.address << ":" << args.port << "\n";
        return 2;
    }

    while (!g_interrupted.load() && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[main] Received interrupt signal, shutting down gracefully..." << std::endl;
    server.stop();
    return 0;
}
