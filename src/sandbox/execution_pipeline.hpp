#pragma once
#include "compile_stage.hpp"
#include "execute_stage.hpp"
#include "execution_result.hpp"
#include "sandbox_config.hpp"
#include "workspace.hpp"
#include <chrono>
#include <optional>
#include <string>

// Pending -> Created -> SourceWritten -> Compiled -> Executed -> Cleaned
// A rejected compile goes Compiled -> Cleaned; any infrastructure error goes
// straight to Cleaned. Every run ends in Cleaned with the workspace removed.
enum class PipelineState {
    Pending,
    Created,
    SourceWritten,
    Compiled,
    Executed,
    Cleaned
};

enum class StepResult {
    Ok,
    CompileRejected,
    InfrastructureError
};

PipelineState next_state(PipelineState from, StepResult step);
const char* to_string(PipelineState s);

class ExecutionPipeline {
public:
    ExecutionPipeline(std::string source_text, SandboxConfig cfg);

    ExecutionPipeline(const ExecutionPipeline&) = delete;
    ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

    // Performs the work of the current state and moves to the next one.
    // No-op once Cleaned.
    void advance();

    // Advances until Cleaned and returns the result.
    ExecutionResult run();

    PipelineState state() const { return state_; }
    bool finished() const { return state_ == PipelineState::Cleaned; }
    const ExecutionResult& result() const { return result_; }

    // Directory of the current attempt; empty before Created and after Cleaned.
    std::filesystem::path workspace_path() const;

private:
    StepResult step();
    StepResult fail(std::string message);
    uint64_t elapsed_ms() const;

    std::string source_;
    SandboxConfig cfg_;
    PipelineState state_{PipelineState::Pending};
    std::chrono::steady_clock::time_point start_;
    std::optional<Workspace> workspace_;
    std::optional<CompileOutcome> compile_;
    ExecutionResult result_;
};
