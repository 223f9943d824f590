#include "compile_stage.hpp"
#include "process_runner.hpp"
#include "utf8.hpp"
#include <system_error>
#include <fstream>

std::string write_source(const Workspace& ws, const std::string& source_name, const std::string& source_text) {
    auto path = ws.file(source_name);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            return "cannot open " + path.string() + ": is a directory";
        }
        return "cannot open " + path.string() + " for writing";
    }
    file.write(source_text.data(), static_cast<std::streamsize>(source_text.size()));
    file.close();
    if (!file) {
        return std::string("write to ") + path.string() + " failed";
    }
    return "";
}

CompileOutcome run_compiler(const Workspace& ws, const SandboxConfig& cfg) {
    CompileOutcome out;

    ProcessSpec spec;
    spec.argv = {
        cfg.compiler,
        "--edition", cfg.edition,
        ws.file(cfg.source_name).string(),
        "-o", ws.file(cfg.artifact_name).string()
    };
    spec.cwd = ws.path();
    spec.timeout = cfg.compile_timeout;
    spec.max_output_bytes = cfg.max_output_bytes;

    ProcessOutcome p = run_process(spec);
    out.ms = p.ms;

    switch (p.status) {
        case ProcessStatus::SpawnFailed:
            out.error = "Failed to run " + cfg.compiler + ": " + p.error;
            return out;
        case ProcessStatus::TimedOut:
            out.error = "Compilation timed out (" + describe_limit(cfg.compile_timeout) + " limit)";
            return out;
        case ProcessStatus::Completed:
            break;
    }

    // Compiler stdout is not part of the diagnostics.
    out.compiled = p.succeeded();
    out.diagnostics = utf8_lossy(p.stderr_bytes);
    if (p.stderr_truncated) out.diagnostics += kTruncatedMarker;
    return out;
}

CompileOutcome compile(const Workspace& ws, const std::string& source_text, const SandboxConfig& cfg) {
    std::string werr = write_source(ws, cfg.source_name, source_text);
    if (!werr.empty()) {
        CompileOutcome out;
        out.error = "Failed to write source: " + werr;
        return out;
    }
    return run_compiler(ws, cfg);
}
