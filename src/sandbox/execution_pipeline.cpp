#include "execution_pipeline.hpp"
#include <iostream>

PipelineState next_state(PipelineState from, StepResult step) {
    if (from == PipelineState::Cleaned || step == StepResult::InfrastructureError) {
        return PipelineState::Cleaned;
    }
    switch (from) {
        case PipelineState::Pending: return PipelineState::Created;
        case PipelineState::Created: return PipelineState::SourceWritten;
        case PipelineState::SourceWritten: return PipelineState::Compiled;
        case PipelineState::Compiled:
            return step == StepResult::CompileRejected ? PipelineState::Cleaned : PipelineState::Executed;
        case PipelineState::Executed: return PipelineState::Cleaned;
        case PipelineState::Cleaned: break;
    }
    return PipelineState::Cleaned;
}

const char* to_string(PipelineState s) {
    switch (s) {
        case PipelineState::Pending: return "pending";
        case PipelineState::Created: return "created";
        case PipelineState::SourceWritten: return "source_written";
        case PipelineState::Compiled: return "compiled";
        case PipelineState::Executed: return "executed";
        case PipelineState::Cleaned: return "cleaned";
    }
    return "unknown";
}

ExecutionPipeline::ExecutionPipeline(std::string source_text, SandboxConfig cfg)
    : source_(std::move(source_text)), cfg_(std::move(cfg)) {}

std::filesystem::path ExecutionPipeline::workspace_path() const {
    return workspace_ ? workspace_->path() : std::filesystem::path();
}

uint64_t ExecutionPipeline::elapsed_ms() const {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now() - start_).count());
}

StepResult ExecutionPipeline::fail(std::string message) {
    // Workspace acquisition failures happen before timing starts.
    uint64_t elapsed = state_ == PipelineState::Pending ? 0 : elapsed_ms();
    result_ = ExecutionResult::infrastructure_error(std::move(message), elapsed);
    return StepResult::InfrastructureError;
}

StepResult ExecutionPipeline::step() {
    switch (state_) {
        case PipelineState::Pending: {
            start_ = std::chrono::steady_clock::now();
            auto acquired = Workspace::acquire(cfg_.resolved_workspace_root());
            if (!acquired.workspace) {
                return fail("Failed to create temp dir: " + acquired.error);
            }
            workspace_ = std::move(acquired.workspace);
            return StepResult::Ok;
        }
        case PipelineState::Created: {
            std::string err = write_source(*workspace_, cfg_.source_name, source_);
            if (!err.empty()) {
                return fail("Failed to write source: " + err);
            }
            return StepResult::Ok;
        }
        case PipelineState::SourceWritten: {
            compile_ = run_compiler(*workspace_, cfg_);
            if (compile_->error) {
                return fail(*compile_->error);
            }
            return StepResult::Ok;
        }
        case PipelineState::Compiled: {
            if (!compile_->compiled) {
                result_ = ExecutionResult{};
                result_.stderr_text = compile_->diagnostics;
                result_.success = false;
                result_.execution_time_ms = elapsed_ms();
                return StepResult::CompileRejected;
            }
            RunOutcome run = execute(*workspace_, cfg_);
            if (run.error) {
                return fail(*run.error);
            }
            result_ = ExecutionResult{};
            result_.stdout_text = std::move(run.stdout_text);
            result_.stderr_text = std::move(run.stderr_text);
            result_.success = run.success;
            result_.execution_time_ms = elapsed_ms();
            return StepResult::Ok;
        }
        case PipelineState::Executed:
        case PipelineState::Cleaned:
            return StepResult::Ok;
    }
    return StepResult::Ok;
}

void ExecutionPipeline::advance() {
    if (state_ == PipelineState::Cleaned) return;

    StepResult r;
    try {
        r = step();
    } catch (const std::exception& e) {
        r = fail(std::string("Internal sandbox error: ") + e.what());
    }

    state_ = next_state(state_, r);
    if (state_ == PipelineState::Cleaned) {
        workspace_.reset();
    }
}

ExecutionResult ExecutionPipeline::run() {
    while (!finished()) {
        advance();
    }
    return result_;
}
