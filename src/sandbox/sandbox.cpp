#include "sandbox.hpp"
#include "execution_pipeline.hpp"
#include "../digest.hpp"
#include <iostream>

Sandbox::Sandbox(SandboxConfig cfg, bool verbose) : cfg_(std::move(cfg)), verbose_(verbose) {
    std::cout << "[sandbox] compiler=" << cfg_.compiler << " --edition " << cfg_.edition
              << ", workspaces under " << cfg_.resolved_workspace_root()
              << ", compile limit " << describe_limit(cfg_.compile_timeout)
              << ", run limit " << describe_limit(cfg_.run_timeout) << std::endl;
}

ExecutionResult Sandbox::execute(const std::string& code) const {
    uint64_t id = next_id_++;
    if (verbose_) {
        std::cout << "[sandbox] #" << id << " start: " << code.size() << " bytes, sha256 "
                  << sha256_hex(code).substr(0, 12) << std::endl;
    }

    ExecutionPipeline pipeline(code, cfg_);
    ExecutionResult r = pipeline.run();

    if (r.error) {
        std::cerr << "[sandbox] #" << id << " infrastructure error: " << *r.error << std::endl;
    } else if (verbose_) {
        std::cout << "[sandbox] #" << id << " done: success=" << (r.success ? "true" : "false")
                  << " stdout=" << r.stdout_text.size() << "B stderr=" << r.stderr_text.size()
                  << "B in " << r.execution_time_ms << "ms" << std::endl;
    }
    return r;
}
