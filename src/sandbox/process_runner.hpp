#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct ProcessSpec {
    // argv[0] is looked up on PATH when it contains no '/'.
    std::vector<std::string> argv;
    std::filesystem::path cwd;
    std::chrono::milliseconds timeout{0};
    // Per stream. Output past it is still read from the pipe but dropped.
    size_t max_output_bytes{1024 * 1024};
};

enum class ProcessStatus {
    Completed,
    SpawnFailed,
    TimedOut
};

struct ProcessOutcome {
    ProcessStatus status{ProcessStatus::SpawnFailed};
    bool exited{false};      // WIFEXITED
    int exit_code{-1};
    int term_signal{0};      // WTERMSIG when killed by a signal
    std::vector<uint8_t> stdout_bytes;
    std::vector<uint8_t> stderr_bytes;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string error;       // spawn failure reason
    double ms{0.0};

    bool succeeded() const {
        return status == ProcessStatus::Completed && exited && exit_code == 0;
    }
};

// Runs one child in its own process group with stdin on /dev/null and both
// output streams captured. When the deadline passes the whole group is sent
// SIGKILL and the child is reaped before returning, so nothing it started
// outlives the call.
ProcessOutcome run_process(const ProcessSpec& spec);

const char* to_string(ProcessStatus s);
