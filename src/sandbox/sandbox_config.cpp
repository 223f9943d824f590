#include "sandbox_config.hpp"
#include <system_error>

std::filesystem::path SandboxConfig::resolved_workspace_root() const {
    if (!workspace_root.empty()) return workspace_root;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : tmp;
}

std::string SandboxConfig::validate() const {
    if (compiler.empty()) return "compiler must not be empty";
    if (source_name.empty() || artifact_name.empty()) return "source and artifact names must not be empty";
    if (source_name == artifact_name) return "source and artifact names must differ";
    if (max_output_bytes == 0) return "output limit must be positive";
    if (run_timeout.count() <= 0) return "run timeout must be positive";
    if (compile_timeout <= run_timeout) return "compile timeout must be longer than run timeout";
    return "";
}

std::string describe_limit(std::chrono::milliseconds limit) {
    auto ms = limit.count();
    if (ms % 1000 == 0) return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}
