#pragma once
#include "sandbox_config.hpp"
#include "workspace.hpp"
#include <optional>
#include <string>

struct RunOutcome {
    // Spawn failure or timeout. Streams are empty when set.
    std::optional<std::string> error;
    bool success{false};
    int exit_code{-1};
    int term_signal{0};
    std::string stdout_text;
    std::string stderr_text;
    double ms{0.0};
};

// Runs the compiled artifact from the workspace with no arguments and no stdin.
RunOutcome execute(const Workspace& ws, const SandboxConfig& cfg);
