#pragma once
#include "execution_result.hpp"
#include "sandbox_config.hpp"
#include <atomic>
#include <string>

// Compiles and runs untrusted snippets. Every call gets its own workspace and
// child processes, so execute() may run concurrently from any thread.
class Sandbox {
public:
    explicit Sandbox(SandboxConfig cfg, bool verbose = true);

    ExecutionResult execute(const std::string& code) const;
    ExecutionResult execute(const ExecutionRequest& req) const { return execute(req.code); }

    const SandboxConfig& config() const { return cfg_; }

private:
    SandboxConfig cfg_;
    bool verbose_;
    mutable std::atomic<uint64_t> next_id_{1};
};
