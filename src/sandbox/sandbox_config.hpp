#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

struct SandboxConfig {
    std::string compiler = "rustc";
    std::string edition = "2021";
    std::string source_name = "main.rs";
    std::string artifact_name = "main";
    std::filesystem::path workspace_root;   // empty: host temp directory
    std::chrono::milliseconds compile_timeout{10000};
    std::chrono::milliseconds run_timeout{5000};
    size_t max_output_bytes = 1024 * 1024;   // per captured stream

    std::filesystem::path resolved_workspace_root() const;

    // Empty when usable, otherwise what is wrong with it.
    std::string validate() const;
};

// Appended to a captured stream that hit max_output_bytes.
inline constexpr char kTruncatedMarker[] = "\n[output truncated]\n";

// "10s" for whole seconds, "250ms" otherwise.
std::string describe_limit(std::chrono::milliseconds limit);
