#include "execution_result.hpp"

ExecutionResult ExecutionResult::infrastructure_error(std::string message, uint64_t elapsed_ms) {
    ExecutionResult r;
    r.success = false;
    r.execution_time_ms = elapsed_ms;
    r.error = std::move(message);
    return r;
}

nlohmann::json to_json(const ExecutionResult& r) {
    nlohmann::json j = {
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"success", r.success},
        {"execution_time_ms", r.execution_time_ms}
    };
    if (r.error) {
        j["error"] = *r.error;
    }
    return j;
}

std::optional<ExecutionRequest> execution_request_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("code");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    ExecutionRequest req;
    req.code = it->get<std::string>();
    return req;
}
