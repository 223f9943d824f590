#include "execute_stage.hpp"
#include "process_runner.hpp"
#include "utf8.hpp"

RunOutcome execute(const Workspace& ws, const SandboxConfig& cfg) {
    RunOutcome out;

    ProcessSpec spec;
    spec.argv = { ws.file(cfg.artifact_name).string() };
    spec.cwd = ws.path();
    spec.timeout = cfg.run_timeout;
    spec.max_output_bytes = cfg.max_output_bytes;

    ProcessOutcome p = run_process(spec);
    out.ms = p.ms;

    if (p.status == ProcessStatus::SpawnFailed) {
        out.error = "Failed to run binary: " + p.error;
        return out;
    }
    if (p.status == ProcessStatus::TimedOut) {
        out.error = "Execution timed out (" + describe_limit(cfg.run_timeout) + " limit)";
        return out;
    }

    out.success = p.succeeded();
    out.exit_code = p.exit_code;
    out.term_signal = p.term_signal;
    out.stdout_text = utf8_lossy(p.stdout_bytes);
    out.stderr_text = utf8_lossy(p.stderr_bytes);
    if (p.stdout_truncated) out.stdout_text += kTruncatedMarker;
    if (p.stderr_truncated) out.stderr_text += kTruncatedMarker;
    return out;
}
