#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

struct ExecutionRequest {
    std::string code;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    bool success{false};
    uint64_t execution_time_ms{0};
    std::optional<std::string> error;

    // Infrastructure failure: empty streams, no success, only the message.
    static ExecutionResult infrastructure_error(std::string message, uint64_t elapsed_ms = 0);

    bool is_infrastructure_error() const { return error.has_value(); }
};

// Wire shape of POST /api/playground/run. "error" is omitted when absent.
nlohmann::json to_json(const ExecutionResult& r);

// Parses {"code": string}. Returns nullopt when the body is not an object
// carrying a string "code".
std::optional<ExecutionRequest> execution_request_from_json(const nlohmann::json& j);
