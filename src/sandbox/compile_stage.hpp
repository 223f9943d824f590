#pragma once
#include "sandbox_config.hpp"
#include "workspace.hpp"
#include <optional>
#include <string>

struct CompileOutcome {
    // Set when the compiler could not be attempted or did not finish:
    // source write failure, spawn failure, timeout.
    std::optional<std::string> error;
    bool compiled{false};        // compiler exited with status 0
    std::string diagnostics;     // compiler stderr
    double ms{0.0};
};

// Writes the source into the workspace. Empty string on success.
std::string write_source(const Workspace& ws, const std::string& source_name, const std::string& source_text);

// Writes `source_text` to the workspace and runs the compiler on it.
CompileOutcome compile(const Workspace& ws, const std::string& source_text, const SandboxConfig& cfg);

// Runs the compiler on an already written source file.
CompileOutcome run_compiler(const Workspace& ws, const SandboxConfig& cfg);
