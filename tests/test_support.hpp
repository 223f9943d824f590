#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/stat.h>

#include "../src/sandbox/sandbox_config.hpp"

namespace test_support {

inline int& tests_run() {
    static int n = 0;
    return n;
}

inline void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        std::exit(1);
    }
}

inline void run_test(const std::string& name, void (*fn)()) {
    std::cout << "  " << name << "..." << std::flush;
    fn();
    std::cout << " PASSED\n";
    tests_run()++;
}

inline int finish(const char* suite) {
    std::cout << suite << ": " << tests_run() << " tests passed\n";
    return 0;
}

// Scratch directory removed at scope exit.
struct ScratchDir {
    std::filesystem::path path;

    explicit ScratchDir(const std::string& prefix) {
        std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
        char* made = ::mkdtemp(tmpl.data());
        expect(made != nullptr, "mkdtemp for " + prefix);
        path = made;
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
};

inline void write_text(const std::filesystem::path& p, const std::string& text) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f << text;
    expect(static_cast<bool>(f), "write " + p.string());
}

inline bool dir_is_empty(const std::filesystem::path& p) {
    return std::filesystem::is_empty(p);
}

// Shell script with the compiler command line `--edition E SRC -o OUT`.
// The "artifact" is the source run as a shell script. Sources containing
// COMPILE_ERROR are rejected with a diagnostic, COMPILE_HANG never finishes.
inline std::filesystem::path write_fake_compiler(const std::filesystem::path& dir) {
    auto p = dir / "fakec";
    write_text(p,
        "#!/bin/sh\n"
        "[ \"$1\" = \"--edition\" ] || { echo \"error: missing --edition\" >&2; exit 2; }\n"
        "src=\"$3\"\n"
        "out=\"$5\"\n"
        "if grep -q COMPILE_HANG \"$src\"; then sleep 30; fi\n"
        "if grep -q COMPILE_ERROR \"$src\"; then\n"
        "  echo \"error: expected item, found \\`COMPILE_ERROR\\`\" >&2\n"
        "  echo \" --> $src:1:1\" >&2\n"
        "  exit 1\n"
        "fi\n"
        "{ echo '#!/bin/sh'; cat \"$src\"; } > \"$out\" || exit 1\n"
        "chmod +x \"$out\"\n");
    ::chmod(p.c_str(), 0755);
    return p;
}

inline SandboxConfig fake_config(const std::filesystem::path& compiler,
                                 const std::filesystem::path& workspace_root) {
    SandboxConfig cfg;
    cfg.compiler = compiler.string();
    cfg.edition = "2021";
    cfg.workspace_root = workspace_root;
    cfg.compile_timeout = std::chrono::milliseconds(3000);
    cfg.run_timeout = std::chrono::milliseconds(1000);
    return cfg;
}

} // namespace test_support
